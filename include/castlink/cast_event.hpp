#ifndef CASTLINK_CAST_EVENT_HPP
#define CASTLINK_CAST_EVENT_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "castlink/response.hpp"

namespace castlink
{

using nlohmann::json;

enum class cast_event_type
{
    application_availability,
    close,
    connected,
    custom_message,
    device_added,
    device_removed,
    device_updated,
    error_response,
    launch_error,
    media_status,
    multizone_status,
    receiver_status,
    unknown
};

std::string_view to_string(cast_event_type type);

enum class connection_state
{
    disconnected,
    connecting,
    connected
};

std::string_view to_string(connection_state state);

// Data of a cast_event_type::close event
struct close_message_event
{
    std::string source_id;
    std::string destination_id;
    std::string nspace;
};

// Data of a cast_event_type::connected event
struct connection_event
{
    connection_state previous;
    connection_state current;

    bool connected() const
    {
        return current == connection_state::connected;
    }
};

class cast_event
{
public:

    using data_type = std::variant<
        std::monostate,
        connection_event,
        close_message_event,
        app_availability_response,
        custom_message,
        device_added_response,
        device_removed_response,
        device_updated_response,
        error_response,
        launch_error_response,
        media_status_response,
        multizone_status_response,
        receiver_status_response,
        std::shared_ptr<json>
    >;

    cast_event(cast_event_type type, data_type data)
        : m_type {type}, m_data {std::move(data)}
    {}

    cast_event_type type() const noexcept
    {
        return m_type;
    }

    const data_type& data() const noexcept
    {
        return m_data;
    }

    // Typed access to the event data, nullptr if the event carries something else
    template<typename T>
    const T* get() const noexcept
    {
        return std::get_if<T>(&m_data);
    }

    // Mutable JSON payload of unknown events, nullptr for every other event
    json* unknown_payload() const noexcept
    {
        auto ptr = std::get_if<std::shared_ptr<json>>(&m_data);
        return ptr ? ptr->get() : nullptr;
    }

    // Returns a copy of the event whose JSON payload (if any) is an independent deep copy
    cast_event deep_copy() const;

private:

    cast_event_type m_type;

    data_type m_data;

};

// Converts a message which was not a response to a pending request into the event delivered to listeners.
// Returns std::nullopt for messages which are not forwarded (heartbeat traffic, media status without status).
std::optional<cast_event> to_event(decoded_message&& msg, const cast_message& envelope);

class cast_event_listener
{
public:
    virtual ~cast_event_listener() = default;

    virtual void on_event(const cast_event& event) = 0;
};

class connection_listener
{
public:
    virtual ~connection_listener() = default;

    virtual void on_connection_event(const connection_event& event) = 0;
};

} // namespace castlink

#endif
