#ifndef CASTLINK_FRAME_HPP
#define CASTLINK_FRAME_HPP

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "castlink/error.hpp"

namespace castlink
{

// Every message on a cast connection is prefixed with its length as 4 byte big endian unsigned integer
static constexpr size_t frame_header_size = 4;

static constexpr uint64_t max_frame_payload = std::numeric_limits<uint32_t>::max();

std::vector<char> encode_frame(std::string_view payload);

// Reconstructs the unsigned payload length from the 4 header bytes
uint32_t frame_length(const std::array<char, frame_header_size>& header);

namespace detail
{

// Reads until the buffer is full or the source is closed. Returns the number of bytes read.
template<typename source_type>
size_t read_fully(source_type& source, char* buffer, size_t len)
{
    size_t br = 0;
    while(br < len)
    {
        size_t n = source.read(buffer + br, len - br);
        if(n == 0)
            break;
        br += n;
    }
    return br;
}

} // namespace detail

// Reads exactly one frame from the source and returns its payload.
// The source type only needs a member size_t read(char* buffer, size_t len) which returns 0 once closed.
template<typename source_type>
std::string read_frame(source_type& source, uint64_t max_size = max_frame_payload)
{
    std::array<char, frame_header_size> header;
    size_t br = detail::read_fully(source, header.data(), header.size());
    if(br == 0)
        throw connection_error {connection_error::reason::closed, "Remote socket closed"};
    if(br < header.size())
        throw framing_error {framing_error::reason::truncated_length,
            fmt::format("Stream closed after {} of {} length bytes", br, header.size()), header.size(), br};

    const uint32_t len = frame_length(header);
    if(len > max_size)
        throw framing_error {framing_error::reason::too_large,
            fmt::format("Frame of {} bytes exceeds the maximum of {} bytes", len, max_size), len, 0};

    std::string payload;
    payload.resize(len);
    br = detail::read_fully(source, payload.data(), len);
    if(br < len)
        throw framing_error {framing_error::reason::truncated_payload,
            fmt::format("Stream closed after {} of {} payload bytes", br, len), len, br};

    return payload;
}

} // namespace castlink

#endif
