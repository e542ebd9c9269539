#include "castlink/frame.hpp"

#include <cstring>

#include <arpa/inet.h>

namespace castlink
{

std::vector<char> encode_frame(std::string_view payload)
{
    if(payload.size() > max_frame_payload)
        throw framing_error {framing_error::reason::too_large,
            fmt::format("Payload of {} bytes does not fit into a frame", payload.size()), payload.size(), 0};

    const uint32_t len = htonl(static_cast<uint32_t>(payload.size()));

    std::vector<char> data;
    data.resize(frame_header_size + payload.size());
    std::memcpy(data.data(), &len, frame_header_size);
    std::memcpy(data.data() + frame_header_size, payload.data(), payload.size());
    return data;
}

uint32_t frame_length(const std::array<char, frame_header_size>& header)
{
    // Copy the raw bytes instead of shifting chars, which would sign extend on most platforms
    uint32_t len;
    std::memcpy(&len, header.data(), frame_header_size);
    return ntohl(len);
}

} // namespace castlink
