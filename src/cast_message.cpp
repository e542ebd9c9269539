#include "castlink/cast_message.hpp"

#include <array>

#include "cast_channel.pb.h"
#include "castlink/error.hpp"

namespace castlink
{

using proto_message = cast_channel::CastMessage;

std::string serialize(const cast_message& msg)
{
    proto_message pb;
    pb.set_protocol_version(pb.CASTV2_1_0);
    pb.set_source_id(msg.source_id);
    pb.set_destination_id(msg.destination_id);
    pb.set_namespace_(msg.nspace);
    if(msg.kind == cast_message::payload_kind::string)
    {
        pb.set_payload_type(pb.STRING);
        pb.set_payload_utf8(msg.payload);
    }
    else
    {
        pb.set_payload_type(pb.BINARY);
        pb.set_payload_binary(msg.payload);
    }

    std::string data;
    if(!pb.SerializeToString(&data))
        throw decode_error {"Unable to serialize cast message", msg.payload};
    return data;
}

cast_message parse_cast_message(std::string_view bytes)
{
    proto_message pb;
    if(!pb.ParseFromArray(bytes.data(), static_cast<int>(bytes.size())))
        throw decode_error {"Error while processing protobuf", std::string {bytes}};

    cast_message msg;
    msg.source_id = pb.source_id();
    msg.destination_id = pb.destination_id();
    msg.nspace = pb.namespace_();
    if(pb.payload_type() == pb.STRING)
    {
        msg.kind = cast_message::payload_kind::string;
        msg.payload = pb.payload_utf8();
    }
    else
    {
        msg.kind = cast_message::payload_kind::binary;
        msg.payload = pb.payload_binary();
    }
    return msg;
}

bool is_standard_namespace(std::string_view nspace)
{
    static const std::array<std::string_view, 6> standard {
        ns::connection, ns::heartbeat, ns::deviceauth, ns::receiver, ns::media, ns::multizone
    };

    for(const auto& it : standard)
    {
        if(it == nspace)
            return true;
    }
    return false;
}

} // namespace castlink
