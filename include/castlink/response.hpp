#ifndef CASTLINK_RESPONSE_HPP
#define CASTLINK_RESPONSE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "castlink/cast_message.hpp"

namespace castlink
{

using nlohmann::json;

struct volume
{
    std::optional<double> level;
    std::optional<bool> muted;
};

struct application
{
    std::string app_id;
    std::string display_name;
    std::string session_id;
    std::string transport_id;
    std::string status_text;
    std::vector<std::string> namespaces;
    bool idle_screen = false;
};

struct receiver_status
{
    std::vector<application> applications;
    volume vol;
    bool active_input = false;
    bool stand_by = false;

    // Returns the running application with the given id or nullptr
    const application* find_application(std::string_view app_id) const;
};

// Only the fields needed to drive playback are typed, everything else stays in raw
struct media_status
{
    int64_t media_session_id = 0;
    std::string player_state;
    double current_time = 0.0;
    double playback_rate = 1.0;
    std::optional<std::string> idle_reason;
    std::optional<int64_t> current_item_id;
    json raw;
};

// Fields shared by every response of the cast platform
struct standard_response
{
    std::optional<uint64_t> request_id;
    json payload;   // The untyped message
};

struct ping_response : standard_response {};

struct pong_response : standard_response {};

struct close_response : standard_response {};

struct receiver_status_response : standard_response
{
    receiver_status status;
};

struct app_availability_response : standard_response
{
    std::map<std::string, std::string> availability;

    bool available(std::string_view app_id) const;
};

struct media_status_response : standard_response
{
    std::vector<media_status> statuses;
};

struct multizone_status_response : standard_response
{
    json status;
};

// ERROR, INVALID_PLAYER_STATE, INVALID_REQUEST, LOAD_CANCELLED and LOAD_FAILED
struct error_response : standard_response
{
    std::string type;
    std::optional<std::string> reason;
    std::optional<int64_t> item_id;
    std::optional<int64_t> detailed_error_code;
};

struct launch_error_response : standard_response
{
    std::string reason;
};

struct device_added_response : standard_response
{
    json device;
};

struct device_updated_response : standard_response
{
    json device;
};

struct device_removed_response : standard_response
{
    std::string device_id;
};

// Message on an application defined namespace
struct custom_message
{
    std::string nspace;
    std::string source_id;
    std::string destination_id;
    cast_message::payload_kind kind = cast_message::payload_kind::string;
    std::string payload;
    std::optional<uint64_t> request_id;
};

// Well formed JSON without a recognized discriminator
struct unknown_message
{
    std::optional<uint64_t> request_id;
    std::shared_ptr<json> payload;
};

// Payload which is not JSON at all
struct parse_failure
{
    std::string text;
    std::string error;
};

using decoded_message = std::variant<
    ping_response,
    pong_response,
    receiver_status_response,
    app_availability_response,
    media_status_response,
    multizone_status_response,
    close_response,
    error_response,
    launch_error_response,
    device_added_response,
    device_updated_response,
    device_removed_response,
    custom_message,
    unknown_message,
    parse_failure
>;

// Decodes a JSON payload of a standard namespace. Never throws.
decoded_message resolve(std::string_view json_payload);

// Decodes a complete envelope. Payloads of custom namespaces and binary payloads become custom_message.
decoded_message resolve(const cast_message& msg);

// Decodes a single media status object, returns std::nullopt if the object is not one
std::optional<media_status> parse_media_status(const json& obj);

receiver_status parse_receiver_status(const json& obj);

std::optional<uint64_t> request_id(const decoded_message& msg);

// Name of the decoded shape, used for logging and error messages
std::string_view type_name(const decoded_message& msg);

// Best effort untyped view of the message, used when reporting unexpected responses
json to_json(const decoded_message& msg);

} // namespace castlink

#endif
