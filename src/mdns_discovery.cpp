#include "castlink/mdns_discovery.hpp"

#include <algorithm>
#include <stdexcept>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <arpa/inet.h>

#include "socketwrapper.hpp"

#include "castlink/log.hpp"

namespace castlink
{

namespace discovery
{

namespace
{

constexpr size_t dns_header_size = 12;
constexpr uint16_t dns_response_flag = 0x8000;
constexpr uint8_t dns_pointer_mask = 0xC0;
constexpr size_t max_name_jumps = 64;

uint8_t read_u8(const std::vector<char>& packet, size_t pos)
{
    if(pos >= packet.size())
        throw std::out_of_range {"Read beyond end of packet"};
    return static_cast<uint8_t>(packet[pos]);
}

uint16_t read_u16(const std::vector<char>& packet, size_t pos)
{
    return static_cast<uint16_t>((read_u8(packet, pos) << 8) | read_u8(packet, pos + 1));
}

uint32_t read_u32(const std::vector<char>& packet, size_t pos)
{
    return (static_cast<uint32_t>(read_u16(packet, pos)) << 16) | read_u16(packet, pos + 2);
}

// Returns the position behind the name at offset, without following compression pointers
size_t skip_name(const std::vector<char>& packet, size_t pos)
{
    while(true)
    {
        uint8_t len = read_u8(packet, pos);
        if((len & dns_pointer_mask) == dns_pointer_mask)
            return pos + 2;
        if(len == 0)
            return pos + 1;
        pos += 1 + len;
    }
}

void write_u16(std::vector<char>& out, uint16_t val)
{
    out.push_back(static_cast<char>(val >> 8));
    out.push_back(static_cast<char>(val & 0xFF));
}

const mdns_record* find_record(const mdns_response& res, record_type type, std::string_view name)
{
    auto it = std::find_if(res.records.begin(), res.records.end(), [type, name](const mdns_record& rec)
    {
        return rec.type == static_cast<uint16_t>(type) && rec.name == name;
    });
    return it != res.records.end() ? &*it : nullptr;
}

} // namespace

std::string device_info::id() const
{
    auto it = txt.find("id");
    return it != txt.end() ? it->second : name;
}

std::vector<char> build_query(std::string_view service)
{
    std::vector<char> query;

    // Header: id 0, no flags, one question
    write_u16(query, 0);
    write_u16(query, 0);
    write_u16(query, 1);
    write_u16(query, 0);
    write_u16(query, 0);
    write_u16(query, 0);

    size_t begin = 0;
    while(begin <= service.size())
    {
        size_t end = service.find('.', begin);
        if(end == std::string_view::npos)
            end = service.size();
        if(end > begin)
        {
            if(end - begin > 63)
                throw std::invalid_argument {"DNS label longer than 63 bytes"};
            query.push_back(static_cast<char>(end - begin));
            query.insert(query.end(), service.begin() + begin, service.begin() + end);
        }
        begin = end + 1;
    }
    query.push_back('\0');

    write_u16(query, static_cast<uint16_t>(record_type::ptr));
    write_u16(query, 1);    // IN
    return query;
}

std::string read_name(const std::vector<char>& packet, size_t offset)
{
    std::string result;
    size_t pos = offset;
    size_t jumps = 0;

    while(true)
    {
        uint8_t len = read_u8(packet, pos);
        if((len & dns_pointer_mask) == dns_pointer_mask)
        {
            if(++jumps > max_name_jumps)
                throw std::out_of_range {"DNS name compression loop"};
            pos = ((len & ~dns_pointer_mask) << 8) | read_u8(packet, pos + 1);
            continue;
        }
        if(len == 0)
            break;
        if(pos + 1 + len > packet.size())
            throw std::out_of_range {"DNS label exceeds packet"};

        if(!result.empty())
            result.push_back('.');
        result.append(&packet[pos + 1], len);
        pos += 1 + len;
    }

    return result;
}

std::optional<mdns_response> parse_response(const std::vector<char>& packet)
{
    try {
        if(packet.size() < dns_header_size || !(read_u16(packet, 2) & dns_response_flag))
            return std::nullopt;

        const uint16_t questions = read_u16(packet, 4);
        const size_t records = static_cast<size_t>(read_u16(packet, 6)) + read_u16(packet, 8) + read_u16(packet, 10);
        if(records == 0)
            return std::nullopt;

        size_t pos = dns_header_size;
        for(uint16_t i = 0; i < questions; ++i)
            pos = skip_name(packet, pos) + 4;

        mdns_response res;
        for(size_t i = 0; i < records; ++i)
        {
            mdns_record& rec = res.records.emplace_back();
            rec.name = read_name(packet, pos);
            pos = skip_name(packet, pos);

            rec.type = read_u16(packet, pos);
            rec.ttl = read_u32(packet, pos + 4);
            const uint16_t len = read_u16(packet, pos + 8);
            pos += 10;

            if(pos + len > packet.size())
                return std::nullopt;
            rec.offset = pos;
            rec.data.assign(packet.begin() + pos, packet.begin() + pos + len);
            pos += len;
        }

        return res;
    } catch(std::out_of_range&) {
        return std::nullopt;
    }
}

std::string parse_ptr_record(const std::vector<char>& packet, const mdns_record& rec)
{
    return read_name(packet, rec.offset);
}

srv_data parse_srv_record(const std::vector<char>& packet, const mdns_record& rec)
{
    // priority (2), weight (2), port (2), target
    if(rec.data.size() < 7)
        throw std::out_of_range {"SRV record too short"};
    return srv_data {read_u16(rec.data, 4), read_name(packet, rec.offset + 6)};
}

std::map<std::string, std::string> parse_txt_record(const mdns_record& rec)
{
    // [1 byte -> len][key=value of length len]...
    std::map<std::string, std::string> txt;
    size_t off = 0;
    while(off < rec.data.size())
    {
        size_t len = static_cast<uint8_t>(rec.data[off++]);
        len = std::min(len, rec.data.size() - off);

        std::string_view entry {&rec.data[off], len};
        size_t sep = entry.find('=');
        if(sep != std::string_view::npos)
            txt.emplace(entry.substr(0, sep), entry.substr(sep + 1));
        else if(!entry.empty())
            txt.emplace(entry, "");

        off += len;
    }
    return txt;
}

std::string parse_a_record(const mdns_record& rec)
{
    if(rec.data.size() != 4)
        throw std::out_of_range {"A record must hold 4 bytes"};

    return std::to_string(static_cast<uint8_t>(rec.data[0])) + '.' +
        std::to_string(static_cast<uint8_t>(rec.data[1])) + '.' +
        std::to_string(static_cast<uint8_t>(rec.data[2])) + '.' +
        std::to_string(static_cast<uint8_t>(rec.data[3]));
}

std::vector<device_info> extract_devices(const std::vector<char>& packet, const mdns_response& res, std::string_view service)
{
    std::vector<device_info> devices;

    for(const auto& rec : res.records)
    {
        if(rec.type != static_cast<uint16_t>(record_type::ptr) || rec.name != service)
            continue;

        try {
            device_info dev;
            dev.name = parse_ptr_record(packet, rec);

            const mdns_record* srv = find_record(res, record_type::srv, dev.name);
            if(!srv)
                continue;
            srv_data target = parse_srv_record(packet, *srv);
            dev.port = target.port;

            const mdns_record* a = find_record(res, record_type::a, target.target);
            if(!a)
                continue;
            dev.address = parse_a_record(*a);

            if(const mdns_record* txt = find_record(res, record_type::txt, dev.name))
                dev.txt = parse_txt_record(*txt);

            auto fn = dev.txt.find("fn");
            dev.friendly_name = (fn != dev.txt.end()) ? fn->second : dev.name.substr(0, dev.name.find('.'));

            devices.push_back(std::move(dev));
        } catch(std::out_of_range& e) {
            log::debug("Skipping malformed mDNS answer: {}", e.what());
        }
    }

    return devices;
}

mdns_browser::mdns_browser(discovery_listener& listener)
    : mdns_browser {listener, options {}}
{}

mdns_browser::mdns_browser(discovery_listener& listener, options opts)
    : m_listener {listener}, m_options {std::move(opts)}
{
    if(m_options.rounds_until_removal == 0)
        throw std::invalid_argument {"rounds_until_removal must be at least 1"};
}

mdns_browser::~mdns_browser()
{
    stop();
}

void mdns_browser::start()
{
    if(m_running.exchange(true))
        return;

    if(m_thread.joinable())
        m_thread.join();
    m_thread = std::thread {&mdns_browser::run, this};
}

void mdns_browser::stop()
{
    m_running.store(false);
    if(m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id())
        m_thread.join();
}

std::vector<device_info> mdns_browser::devices() const
{
    std::vector<device_info> result;
    std::lock_guard<std::mutex> lock {m_devices_mutex};
    for(const auto& it : m_devices)
        result.push_back(it.second.info);
    return result;
}

void mdns_browser::handle_packet(const std::vector<char>& packet)
{
    std::optional<mdns_response> res = parse_response(packet);
    if(!res)
        return;

    std::vector<device_info> added;
    {
        std::lock_guard<std::mutex> lock {m_devices_mutex};
        for(auto& dev : extract_devices(packet, *res, m_options.service))
        {
            auto [it, inserted] = m_devices.try_emplace(dev.id());
            it->second.seen = true;
            it->second.missed = 0;
            it->second.info = std::move(dev);
            if(inserted)
                added.push_back(it->second.info);
        }
    }

    for(const auto& dev : added)
    {
        log::info("Found cast device {} at {}:{}", dev.friendly_name, dev.address, dev.port);
        try {
            m_listener.device_added(dev);
        } catch(std::exception& e) {
            log::warn("Discovery listener failed: {}", e.what());
        }
    }
}

void mdns_browser::finish_round()
{
    std::vector<device_info> removed;
    {
        std::lock_guard<std::mutex> lock {m_devices_mutex};
        for(auto it = m_devices.begin(); it != m_devices.end(); )
        {
            known_device& known = it->second;
            if(known.seen)
            {
                known.seen = false;
                ++it;
            }
            else if(++known.missed >= m_options.rounds_until_removal)
            {
                removed.push_back(std::move(known.info));
                it = m_devices.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for(const auto& dev : removed)
    {
        log::info("Cast device {} vanished", dev.friendly_name);
        try {
            m_listener.device_removed(dev);
        } catch(std::exception& e) {
            log::warn("Discovery listener failed: {}", e.what());
        }
    }
}

void mdns_browser::run()
{
    using namespace std::chrono;

    try {
        net::udp_socket<net::ip_version::v4> q_sock {"0.0.0.0", mdns_port};

        ip_mreq group {};
        ::inet_pton(AF_INET, mdns_group, &group.imr_multiaddr);
        group.imr_interface.s_addr = htonl(INADDR_ANY);
        if(::setsockopt(q_sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &group, sizeof(group)) != 0)
            log::warn("Unable to join mDNS multicast group, only unicast answers are received");

        const std::vector<char> query = build_query(m_options.service);
        const std::string query_bytes {query.begin(), query.end()};

        while(m_running.load())
        {
            log::debug("Sending mDNS query for {}", m_options.service);
            q_sock.send(mdns_group, mdns_port, query_bytes);

            const auto round_end = steady_clock::now() + m_options.query_interval;
            while(m_running.load() && steady_clock::now() < round_end)
            {
                auto remaining = duration_cast<milliseconds>(round_end - steady_clock::now());
                pollfd pfd {q_sock.get(), POLLIN, 0};
                int ready = ::poll(&pfd, 1, static_cast<int>(std::clamp<int64_t>(remaining.count(), 0, 250)));
                if(ready <= 0)
                    continue;

                auto [buffer, peer] = q_sock.read<char>(4096);
                handle_packet(std::vector<char> {buffer.begin(), buffer.end()});
            }

            if(m_running.load())
                finish_round();
        }
    } catch(std::runtime_error& e) {
        log::error("mDNS discovery stopped: {}", e.what());
        m_running.store(false);
    }
}

} // namespace discovery

} // namespace castlink
