#ifndef CASTLINK_MDNS_DISCOVERY_HPP
#define CASTLINK_MDNS_DISCOVERY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace castlink
{

namespace discovery
{

static constexpr const char* googlecast_service = "_googlecast._tcp.local";

static constexpr const char* mdns_group = "224.0.0.251";

static constexpr uint16_t mdns_port = 5353;

enum class record_type : uint16_t
{
    a = 1,
    ptr = 12,
    txt = 16,
    aaaa = 28,
    srv = 33
};

struct mdns_record
{
    std::string name;
    uint16_t type;
    uint32_t ttl;
    size_t offset;              // Position of the record data inside the packet, names may point before it
    std::vector<char> data;
};

struct mdns_response
{
    std::vector<mdns_record> records;   // Answers, authority and additional records
};

struct srv_data
{
    uint16_t port;
    std::string target;
};

struct device_info
{
    std::string name;                       // Service instance name from the PTR record
    std::string friendly_name;              // "fn" entry of the TXT record
    std::string address;                    // From the A record
    uint16_t port = 8009;                   // From the SRV record
    std::map<std::string, std::string> txt;

    // Unique id of the device, the "id" TXT entry or the instance name if missing
    std::string id() const;
};

// Builds a PTR query for the service
std::vector<char> build_query(std::string_view service);

// Returns std::nullopt if the packet is not a well formed mDNS response
std::optional<mdns_response> parse_response(const std::vector<char>& packet);

// Reads a possibly compressed domain name, throws std::out_of_range on malformed input
std::string read_name(const std::vector<char>& packet, size_t offset);

std::string parse_ptr_record(const std::vector<char>& packet, const mdns_record& rec);

srv_data parse_srv_record(const std::vector<char>& packet, const mdns_record& rec);

std::map<std::string, std::string> parse_txt_record(const mdns_record& rec);

std::string parse_a_record(const mdns_record& rec);

// Collects the devices announced for the service. Instances without SRV or A record are skipped.
std::vector<device_info> extract_devices(const std::vector<char>& packet, const mdns_response& res, std::string_view service);

class discovery_listener
{
public:
    virtual ~discovery_listener() = default;

    virtual void device_added(const device_info& device) = 0;

    virtual void device_removed(const device_info& device) = 0;
};

// Periodically queries the local network for cast receivers and reports appearing and vanishing devices
class mdns_browser
{
public:

    struct options
    {
        std::string service = googlecast_service;

        std::chrono::milliseconds query_interval {5000};

        // A device is reported as removed after it did not answer this many queries in a row
        unsigned rounds_until_removal = 3;
    };

    mdns_browser() = delete;
    mdns_browser(const mdns_browser&) = delete;
    mdns_browser& operator=(const mdns_browser&) = delete;
    mdns_browser(mdns_browser&&) = delete;
    mdns_browser& operator=(mdns_browser&&) = delete;
    ~mdns_browser();

    explicit mdns_browser(discovery_listener& listener);

    mdns_browser(discovery_listener& listener, options opts);

    // Starts querying on a background thread. Socket errors end the browsing and are logged.
    void start();

    void stop();

    bool running() const
    {
        return m_running.load();
    }

    std::vector<device_info> devices() const;

    // Processes one received packet, called by the browsing thread
    void handle_packet(const std::vector<char>& packet);

    // Ends a query round and reports devices which missed too many rounds
    void finish_round();

private:

    struct known_device
    {
        device_info info;
        unsigned missed = 0;
        bool seen = false;
    };

    void run();

    discovery_listener& m_listener;

    const options m_options;

    std::atomic<bool> m_running {false};

    std::thread m_thread;

    mutable std::mutex m_devices_mutex;

    std::map<std::string, known_device> m_devices;

};

} // namespace discovery

} // namespace castlink

#endif
