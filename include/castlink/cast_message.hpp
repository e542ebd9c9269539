#ifndef CASTLINK_CAST_MESSAGE_HPP
#define CASTLINK_CAST_MESSAGE_HPP

#include <string>
#include <string_view>

namespace castlink
{

namespace ns
{

static constexpr const char* connection = "urn:x-cast:com.google.cast.tp.connection";
static constexpr const char* heartbeat = "urn:x-cast:com.google.cast.tp.heartbeat";
static constexpr const char* deviceauth = "urn:x-cast:com.google.cast.tp.deviceauth";
static constexpr const char* receiver = "urn:x-cast:com.google.cast.receiver";
static constexpr const char* media = "urn:x-cast:com.google.cast.media";
static constexpr const char* multizone = "urn:x-cast:com.google.cast.multizone";

} // namespace ns

static constexpr const char* default_receiver_id = "receiver-0";

// Decoded form of the protobuf envelope which wraps every payload on the wire
struct cast_message
{
    enum class payload_kind
    {
        string,
        binary
    };

    std::string source_id;
    std::string destination_id;
    std::string nspace;
    payload_kind kind = payload_kind::string;
    std::string payload;    // UTF-8 JSON for payload_kind::string, raw bytes otherwise

    static cast_message text(std::string_view source, std::string_view destination, std::string_view nspace, std::string payload)
    {
        return cast_message {std::string {source}, std::string {destination}, std::string {nspace},
            payload_kind::string, std::move(payload)};
    }

    static cast_message binary(std::string_view source, std::string_view destination, std::string_view nspace, std::string payload)
    {
        return cast_message {std::string {source}, std::string {destination}, std::string {nspace},
            payload_kind::binary, std::move(payload)};
    }
};

// Serializes the envelope into the protobuf wire representation (without frame header)
std::string serialize(const cast_message& msg);

// Throws decode_error if the bytes are not a valid CastMessage
cast_message parse_cast_message(std::string_view bytes);

// True for the namespaces of the cast platform itself, false for application defined namespaces
bool is_standard_namespace(std::string_view nspace);

} // namespace castlink

#endif
