#include "castlink/cast_device.hpp"

#include <stdexcept>
#include <utility>

#include "castlink/error.hpp"
#include "castlink/log.hpp"

namespace castlink
{

namespace
{

media_status first_status(media_status_response&& res, std::string_view request)
{
    if(res.statuses.empty())
        throw unexpected_response_error {fmt::format("{} answered without media status", request), res.payload};
    return std::move(res.statuses.front());
}

void check_id(std::string_view id, const char* what)
{
    if(id.empty())
        throw std::invalid_argument {fmt::format("{} must not be empty", what)};
}

} // namespace

cast_device::cast_device(const discovery::device_info& info, transport_factory factory, channel_options options)
    : cast_device {info.friendly_name.empty() ? info.name : info.friendly_name, info.address, info.port,
        std::move(factory), std::move(options)}
{}

cast_device::cast_device(std::string name, std::string address, uint16_t port, transport_factory factory,
    channel_options options)
    : m_name {std::move(name)},
      m_address {std::move(address)},
      m_port {port},
      m_channel {m_name, std::move(factory), std::move(options)}
{}

void cast_device::connect()
{
    m_channel.connect(m_address, m_port);
}

void cast_device::disconnect()
{
    m_channel.disconnect();
}

receiver_status cast_device::get_status()
{
    return m_channel.send_request<receiver_status_response>(default_receiver_id, ns::receiver,
        json {{"type", "GET_STATUS"}}).status;
}

bool cast_device::app_available(std::string_view app_id)
{
    check_id(app_id, "Application id");

    json msg {{"type", "GET_APP_AVAILABILITY"}, {"appId", json::array({std::string {app_id}})}};
    return m_channel.send_request<app_availability_response>(default_receiver_id, ns::receiver, std::move(msg))
        .available(app_id);
}

application cast_device::launch_app(std::string_view app_id)
{
    check_id(app_id, "Application id");

    receiver_status status = m_channel.send_request<receiver_status_response>(default_receiver_id, ns::receiver,
        json {{"type", "LAUNCH"}, {"appId", std::string {app_id}}}).status;

    const application* app = status.find_application(app_id);
    if(!app)
        throw unexpected_response_error {fmt::format("Application {} is not running after launch", app_id),
            json {{"appId", std::string {app_id}}}};

    log::info("Launched {} on {}, session {}", app_id, m_name, app->session_id);
    return *app;
}

receiver_status cast_device::stop_app(std::string_view session_id)
{
    check_id(session_id, "Session id");

    return m_channel.send_request<receiver_status_response>(default_receiver_id, ns::receiver,
        json {{"type", "STOP"}, {"sessionId", std::string {session_id}}}).status;
}

receiver_status cast_device::set_volume(double level)
{
    if(level < 0.0 || level > 1.0)
        throw std::invalid_argument {fmt::format("Volume level {} out of range [0, 1]", level)};

    return m_channel.send_request<receiver_status_response>(default_receiver_id, ns::receiver,
        json {{"type", "SET_VOLUME"}, {"volume", {{"level", level}}}}).status;
}

receiver_status cast_device::set_muted(bool muted)
{
    return m_channel.send_request<receiver_status_response>(default_receiver_id, ns::receiver,
        json {{"type", "SET_VOLUME"}, {"volume", {{"muted", muted}}}}).status;
}

std::vector<media_status> cast_device::get_media_status(std::string_view transport_id)
{
    check_id(transport_id, "Transport id");

    return m_channel.send_request<media_status_response>(transport_id, ns::media,
        json {{"type", "GET_STATUS"}}).statuses;
}

media_status cast_device::load(std::string_view transport_id, std::string_view session_id, const json& media,
    bool autoplay, double current_time)
{
    check_id(transport_id, "Transport id");
    if(!media.is_object() || !media.contains("contentId"))
        throw std::invalid_argument {"Media information requires a contentId"};

    json msg {
        {"type", "LOAD"},
        {"media", media},
        {"autoplay", autoplay},
        {"currentTime", current_time}
    };
    if(!session_id.empty())
        msg["sessionId"] = std::string {session_id};

    return first_status(m_channel.send_request<media_status_response>(transport_id, ns::media, std::move(msg)), "LOAD");
}

media_status cast_device::play(std::string_view transport_id, std::string_view session_id, int64_t media_session_id)
{
    return media_command(transport_id, session_id, media_session_id, "PLAY");
}

media_status cast_device::pause(std::string_view transport_id, std::string_view session_id, int64_t media_session_id)
{
    return media_command(transport_id, session_id, media_session_id, "PAUSE");
}

media_status cast_device::stop_media(std::string_view transport_id, std::string_view session_id, int64_t media_session_id)
{
    return media_command(transport_id, session_id, media_session_id, "STOP");
}

media_status cast_device::seek(std::string_view transport_id, std::string_view session_id, int64_t media_session_id,
    double current_time)
{
    if(current_time < 0.0)
        throw std::invalid_argument {"Seek position must not be negative"};
    return media_command(transport_id, session_id, media_session_id, "SEEK", current_time);
}

custom_message cast_device::send_custom(std::string_view transport_id, std::string_view nspace, json payload)
{
    check_id(transport_id, "Transport id");
    if(is_standard_namespace(nspace))
        throw std::invalid_argument {fmt::format("{} is not an application namespace", nspace)};

    return m_channel.send_request<custom_message>(transport_id, nspace, std::move(payload));
}

void cast_device::post_custom(std::string_view transport_id, std::string_view nspace, json payload)
{
    check_id(transport_id, "Transport id");
    if(is_standard_namespace(nspace))
        throw std::invalid_argument {fmt::format("{} is not an application namespace", nspace)};

    m_channel.post(transport_id, nspace, std::move(payload));
}

media_status cast_device::media_command(std::string_view transport_id, std::string_view session_id,
    int64_t media_session_id, std::string_view type, std::optional<double> current_time)
{
    check_id(transport_id, "Transport id");

    json msg {{"type", std::string {type}}, {"mediaSessionId", media_session_id}};
    if(!session_id.empty())
        msg["sessionId"] = std::string {session_id};
    if(current_time)
        msg["currentTime"] = *current_time;

    return first_status(m_channel.send_request<media_status_response>(transport_id, ns::media, std::move(msg)), type);
}

} // namespace castlink
