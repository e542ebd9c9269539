#include "castlink/response.hpp"

#include <array>
#include <type_traits>
#include <unordered_map>

namespace castlink
{

namespace
{

using decoder = decoded_message (*)(json&& obj, std::optional<uint64_t> req_id);

std::optional<uint64_t> extract_request_id(const json& obj)
{
    auto it = obj.find("requestId");
    if(it == obj.end())
        return std::nullopt;
    if(it->is_number_unsigned())
        return it->get<uint64_t>();
    if(it->is_number_integer() && it->get<int64_t>() >= 0)
        return static_cast<uint64_t>(it->get<int64_t>());
    return std::nullopt;
}

template<typename response_type>
response_type make_standard(json&& obj, std::optional<uint64_t> req_id)
{
    response_type res;
    res.request_id = req_id;
    res.payload = std::move(obj);
    return res;
}

template<typename value_type>
std::optional<value_type> optional_field(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if(it == obj.end() || it->is_null())
        return std::nullopt;
    return it->get<value_type>();
}

decoded_message decode_ping(json&& obj, std::optional<uint64_t> req_id)
{
    return make_standard<ping_response>(std::move(obj), req_id);
}

decoded_message decode_pong(json&& obj, std::optional<uint64_t> req_id)
{
    return make_standard<pong_response>(std::move(obj), req_id);
}

decoded_message decode_close(json&& obj, std::optional<uint64_t> req_id)
{
    return make_standard<close_response>(std::move(obj), req_id);
}

decoded_message decode_receiver_status(json&& obj, std::optional<uint64_t> req_id)
{
    receiver_status status;
    if(auto it = obj.find("status"); it != obj.end())
        status = parse_receiver_status(*it);

    auto res = make_standard<receiver_status_response>(std::move(obj), req_id);
    res.status = std::move(status);
    return res;
}

decoded_message decode_app_availability(json&& obj, std::optional<uint64_t> req_id)
{
    std::map<std::string, std::string> availability;
    if(auto it = obj.find("availability"); it != obj.end())
        availability = it->get<std::map<std::string, std::string>>();

    auto res = make_standard<app_availability_response>(std::move(obj), req_id);
    res.availability = std::move(availability);
    return res;
}

decoded_message decode_media_status(json&& obj, std::optional<uint64_t> req_id)
{
    std::vector<media_status> statuses;
    if(auto it = obj.find("status"); it != obj.end())
    {
        if(it->is_array())
        {
            for(const auto& elem : *it)
            {
                if(auto ms = parse_media_status(elem))
                    statuses.push_back(std::move(*ms));
            }
        }
        else if(auto ms = parse_media_status(*it))
        {
            statuses.push_back(std::move(*ms));
        }
    }

    // Some receivers push a bare status object instead of the list, try that before giving up
    if(statuses.empty() && (obj.contains("mediaSessionId") || obj.contains("media")))
    {
        if(auto ms = parse_media_status(obj))
            statuses.push_back(std::move(*ms));
    }

    auto res = make_standard<media_status_response>(std::move(obj), req_id);
    res.statuses = std::move(statuses);
    return res;
}

decoded_message decode_multizone_status(json&& obj, std::optional<uint64_t> req_id)
{
    json status = obj.contains("status") ? obj["status"] : json {};
    auto res = make_standard<multizone_status_response>(std::move(obj), req_id);
    res.status = std::move(status);
    return res;
}

decoded_message decode_error_response(json&& obj, std::optional<uint64_t> req_id)
{
    error_response res;
    res.request_id = req_id;
    res.type = obj.contains("responseType") ? obj["responseType"].get<std::string>() : obj.value("type", std::string {});
    res.reason = optional_field<std::string>(obj, "reason");
    res.item_id = optional_field<int64_t>(obj, "itemId");
    res.detailed_error_code = optional_field<int64_t>(obj, "detailedErrorCode");
    res.payload = std::move(obj);
    return res;
}

decoded_message decode_launch_error(json&& obj, std::optional<uint64_t> req_id)
{
    std::string reason = obj.value("reason", std::string {});
    auto res = make_standard<launch_error_response>(std::move(obj), req_id);
    res.reason = std::move(reason);
    return res;
}

decoded_message decode_device_added(json&& obj, std::optional<uint64_t> req_id)
{
    json device = obj.contains("device") ? obj["device"] : json {};
    auto res = make_standard<device_added_response>(std::move(obj), req_id);
    res.device = std::move(device);
    return res;
}

decoded_message decode_device_updated(json&& obj, std::optional<uint64_t> req_id)
{
    json device = obj.contains("device") ? obj["device"] : json {};
    auto res = make_standard<device_updated_response>(std::move(obj), req_id);
    res.device = std::move(device);
    return res;
}

decoded_message decode_device_removed(json&& obj, std::optional<uint64_t> req_id)
{
    std::string device_id = obj.value("deviceId", std::string {});
    auto res = make_standard<device_removed_response>(std::move(obj), req_id);
    res.device_id = std::move(device_id);
    return res;
}

// Discriminator values of the cast platform and the shapes they decode into
const std::unordered_map<std::string_view, decoder>& decoders()
{
    static const std::unordered_map<std::string_view, decoder> table {
        {"PING", &decode_ping},
        {"PONG", &decode_pong},
        {"RECEIVER_STATUS", &decode_receiver_status},
        {"GET_APP_AVAILABILITY", &decode_app_availability},
        {"MEDIA_STATUS", &decode_media_status},
        {"MULTIZONE_STATUS", &decode_multizone_status},
        {"CLOSE", &decode_close},
        {"ERROR", &decode_error_response},
        {"INVALID_PLAYER_STATE", &decode_error_response},
        {"INVALID_REQUEST", &decode_error_response},
        {"LOAD_CANCELLED", &decode_error_response},
        {"LOAD_FAILED", &decode_error_response},
        {"LAUNCH_ERROR", &decode_launch_error},
        {"DEVICE_ADDED", &decode_device_added},
        {"DEVICE_UPDATED", &decode_device_updated},
        {"DEVICE_REMOVED", &decode_device_removed}
    };
    return table;
}

std::optional<std::string> discriminator(const json& obj)
{
    for(const char* key : {"responseType", "type"})
    {
        auto it = obj.find(key);
        if(it != obj.end() && it->is_string())
            return it->get<std::string>();
    }
    return std::nullopt;
}

unknown_message make_unknown(json&& obj, std::optional<uint64_t> req_id)
{
    return unknown_message {req_id, std::make_shared<json>(std::move(obj))};
}

} // namespace

const application* receiver_status::find_application(std::string_view app_id) const
{
    for(const auto& app : applications)
    {
        if(app.app_id == app_id)
            return &app;
    }
    return nullptr;
}

bool app_availability_response::available(std::string_view app_id) const
{
    auto it = availability.find(std::string {app_id});
    return it != availability.end() && it->second == "APP_AVAILABLE";
}

std::optional<media_status> parse_media_status(const json& obj)
{
    if(!obj.is_object())
        return std::nullopt;

    try {
        media_status ms;
        ms.media_session_id = obj.value("mediaSessionId", int64_t {0});
        ms.player_state = obj.value("playerState", std::string {});
        ms.current_time = obj.value("currentTime", 0.0);
        ms.playback_rate = obj.value("playbackRate", 1.0);
        ms.idle_reason = optional_field<std::string>(obj, "idleReason");
        ms.current_item_id = optional_field<int64_t>(obj, "currentItemId");
        ms.raw = obj;
        return ms;
    } catch(json::exception&) {
        return std::nullopt;
    }
}

receiver_status parse_receiver_status(const json& obj)
{
    receiver_status status;
    if(!obj.is_object())
        return status;

    if(auto it = obj.find("volume"); it != obj.end() && it->is_object())
    {
        status.vol.level = optional_field<double>(*it, "level");
        status.vol.muted = optional_field<bool>(*it, "muted");
    }

    if(auto it = obj.find("applications"); it != obj.end() && it->is_array())
    {
        for(const auto& app_data : *it)
        {
            application& app = status.applications.emplace_back();
            app.app_id = app_data.value("appId", std::string {});
            app.display_name = app_data.value("displayName", std::string {});
            app.session_id = app_data.value("sessionId", std::string {});
            app.transport_id = app_data.value("transportId", std::string {});
            app.status_text = app_data.value("statusText", std::string {});
            app.idle_screen = app_data.value("isIdleScreen", false);
            if(auto nit = app_data.find("namespaces"); nit != app_data.end() && nit->is_array())
            {
                for(const auto& n : *nit)
                    app.namespaces.push_back(n.value("name", std::string {}));
            }
        }
    }

    status.active_input = obj.value("isActiveInput", false);
    status.stand_by = obj.value("isStandBy", false);
    return status;
}

decoded_message resolve(std::string_view json_payload)
{
    json obj = json::parse(json_payload.begin(), json_payload.end(), nullptr, false);
    if(obj.is_discarded())
        return parse_failure {std::string {json_payload}, "Malformed JSON"};

    if(!obj.is_object())
        return make_unknown(std::move(obj), std::nullopt);

    const std::optional<uint64_t> req_id = extract_request_id(obj);
    const std::optional<std::string> type = discriminator(obj);
    if(!type)
        return make_unknown(std::move(obj), req_id);

    auto it = decoders().find(*type);
    if(it == decoders().end())
        return make_unknown(std::move(obj), req_id);

    // Keep a copy so a payload with unexpected field types still reaches the caller
    json backup = obj;
    try {
        return it->second(std::move(obj), req_id);
    } catch(json::exception&) {
        return make_unknown(std::move(backup), req_id);
    }
}

decoded_message resolve(const cast_message& msg)
{
    if(msg.kind == cast_message::payload_kind::binary || !is_standard_namespace(msg.nspace))
    {
        custom_message custom {msg.nspace, msg.source_id, msg.destination_id, msg.kind, msg.payload, std::nullopt};
        if(msg.kind == cast_message::payload_kind::string)
        {
            json obj = json::parse(msg.payload, nullptr, false);
            if(!obj.is_discarded() && obj.is_object())
                custom.request_id = extract_request_id(obj);
        }
        return custom;
    }

    return resolve(std::string_view {msg.payload});
}

std::optional<uint64_t> request_id(const decoded_message& msg)
{
    return std::visit([](const auto& m) -> std::optional<uint64_t>
    {
        using T = std::decay_t<decltype(m)>;
        if constexpr(std::is_same_v<T, parse_failure>)
            return std::nullopt;
        else
            return m.request_id;
    }, msg);
}

std::string_view type_name(const decoded_message& msg)
{
    static constexpr std::array<std::string_view, std::variant_size_v<decoded_message>> names {
        "PING",
        "PONG",
        "RECEIVER_STATUS",
        "GET_APP_AVAILABILITY",
        "MEDIA_STATUS",
        "MULTIZONE_STATUS",
        "CLOSE",
        "ERROR",
        "LAUNCH_ERROR",
        "DEVICE_ADDED",
        "DEVICE_UPDATED",
        "DEVICE_REMOVED",
        "CUSTOM_MESSAGE",
        "UNKNOWN",
        "PARSE_FAILURE"
    };
    return names[msg.index()];
}

json to_json(const decoded_message& msg)
{
    return std::visit([](const auto& m) -> json
    {
        using T = std::decay_t<decltype(m)>;
        if constexpr(std::is_base_of_v<standard_response, T>)
        {
            return m.payload;
        }
        else if constexpr(std::is_same_v<T, custom_message>)
        {
            json obj = json::parse(m.payload, nullptr, false);
            return obj.is_discarded() ? json(m.payload) : obj;
        }
        else if constexpr(std::is_same_v<T, unknown_message>)
        {
            return m.payload ? *m.payload : json {};
        }
        else
        {
            return json(m.text);
        }
    }, msg);
}

} // namespace castlink
