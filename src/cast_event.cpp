#include "castlink/cast_event.hpp"

#include <type_traits>

namespace castlink
{

std::string_view to_string(cast_event_type type)
{
    switch(type)
    {
        case cast_event_type::application_availability:
            return "APPLICATION_AVAILABILITY";
        case cast_event_type::close:
            return "CLOSE";
        case cast_event_type::connected:
            return "CONNECTED";
        case cast_event_type::custom_message:
            return "CUSTOM_MESSAGE";
        case cast_event_type::device_added:
            return "DEVICE_ADDED";
        case cast_event_type::device_removed:
            return "DEVICE_REMOVED";
        case cast_event_type::device_updated:
            return "DEVICE_UPDATED";
        case cast_event_type::error_response:
            return "ERROR_RESPONSE";
        case cast_event_type::launch_error:
            return "LAUNCH_ERROR";
        case cast_event_type::media_status:
            return "MEDIA_STATUS";
        case cast_event_type::multizone_status:
            return "MULTIZONE_STATUS";
        case cast_event_type::receiver_status:
            return "RECEIVER_STATUS";
        default:
            return "UNKNOWN";
    }
}

std::string_view to_string(connection_state state)
{
    switch(state)
    {
        case connection_state::connecting:
            return "connecting";
        case connection_state::connected:
            return "connected";
        default:
            return "disconnected";
    }
}

cast_event cast_event::deep_copy() const
{
    if(auto ptr = std::get_if<std::shared_ptr<json>>(&m_data); ptr && *ptr)
        return cast_event {m_type, std::make_shared<json>(**ptr)};
    return *this;
}

std::optional<cast_event> to_event(decoded_message&& msg, const cast_message& envelope)
{
    return std::visit([&envelope](auto&& m) -> std::optional<cast_event>
    {
        using T = std::decay_t<decltype(m)>;
        if constexpr(std::is_same_v<T, receiver_status_response>)
        {
            return cast_event {cast_event_type::receiver_status, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, media_status_response>)
        {
            // Neither the list nor the bare form contained a status, nothing to report
            if(m.statuses.empty())
                return std::nullopt;
            return cast_event {cast_event_type::media_status, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, app_availability_response>)
        {
            return cast_event {cast_event_type::application_availability, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, multizone_status_response>)
        {
            return cast_event {cast_event_type::multizone_status, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, close_response>)
        {
            return cast_event {cast_event_type::close,
                close_message_event {envelope.source_id, envelope.destination_id, envelope.nspace}};
        }
        else if constexpr(std::is_same_v<T, error_response>)
        {
            return cast_event {cast_event_type::error_response, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, launch_error_response>)
        {
            return cast_event {cast_event_type::launch_error, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, device_added_response>)
        {
            return cast_event {cast_event_type::device_added, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, device_updated_response>)
        {
            return cast_event {cast_event_type::device_updated, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, device_removed_response>)
        {
            return cast_event {cast_event_type::device_removed, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, custom_message>)
        {
            return cast_event {cast_event_type::custom_message, std::move(m)};
        }
        else if constexpr(std::is_same_v<T, unknown_message>)
        {
            return cast_event {cast_event_type::unknown, std::move(m.payload)};
        }
        else if constexpr(std::is_same_v<T, parse_failure>)
        {
            // Keep the text so listeners can still look at what the receiver sent
            return cast_event {cast_event_type::unknown, std::make_shared<json>(m.text)};
        }
        else
        {
            // PING and PONG are heartbeat traffic
            return std::nullopt;
        }
    }, std::move(msg));
}

} // namespace castlink
