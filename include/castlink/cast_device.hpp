#ifndef CASTLINK_CAST_DEVICE_HPP
#define CASTLINK_CAST_DEVICE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "castlink/channel.hpp"
#include "castlink/mdns_discovery.hpp"
#include "castlink/response.hpp"

namespace castlink
{

using nlohmann::json;

static constexpr const char* default_media_receiver_id = "CC1AD845";

// High level operations on a single cast receiver, built on top of a channel
class cast_device
{
public:

    cast_device() = delete;
    cast_device(const cast_device&) = delete;
    cast_device& operator=(const cast_device&) = delete;
    cast_device(cast_device&&) = delete;
    cast_device& operator=(cast_device&&) = delete;
    ~cast_device() = default;

    cast_device(const discovery::device_info& info, transport_factory factory, channel_options options = {});

    cast_device(std::string name, std::string address, uint16_t port, transport_factory factory,
        channel_options options = {});

    void connect();

    void disconnect();

    bool connected() const
    {
        return m_channel.connected();
    }

    receiver_status get_status();

    bool app_available(std::string_view app_id);

    // Launches the application and returns its running instance
    application launch_app(std::string_view app_id = default_media_receiver_id);

    receiver_status stop_app(std::string_view session_id);

    // Level between 0.0 and 1.0
    receiver_status set_volume(double level);

    receiver_status set_muted(bool muted);

    std::vector<media_status> get_media_status(std::string_view transport_id);

    // media is a MediaInformation object ({"contentId": ..., "contentType": ..., "streamType": ...})
    media_status load(std::string_view transport_id, std::string_view session_id, const json& media,
        bool autoplay = true, double current_time = 0.0);

    media_status play(std::string_view transport_id, std::string_view session_id, int64_t media_session_id);

    media_status pause(std::string_view transport_id, std::string_view session_id, int64_t media_session_id);

    media_status stop_media(std::string_view transport_id, std::string_view session_id, int64_t media_session_id);

    media_status seek(std::string_view transport_id, std::string_view session_id, int64_t media_session_id,
        double current_time);

    // Request on an application defined namespace, the response is returned untyped
    custom_message send_custom(std::string_view transport_id, std::string_view nspace, json payload);

    // Like send_custom() without waiting for a response
    void post_custom(std::string_view transport_id, std::string_view nspace, json payload);

    inline const std::string& get_name() const
    {
        return m_name;
    }

    inline const std::string& get_address() const
    {
        return m_address;
    }

    inline uint16_t get_port() const
    {
        return m_port;
    }

    channel& get_channel()
    {
        return m_channel;
    }

private:

    /// Private member functions

    media_status media_command(std::string_view transport_id, std::string_view session_id, int64_t media_session_id,
        std::string_view type, std::optional<double> current_time = std::nullopt);

    /// Private member variables

    std::string m_name;

    std::string m_address;

    uint16_t m_port;

    channel m_channel;

};

} // namespace castlink

#endif
