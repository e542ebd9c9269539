#ifndef CASTLINK_ERROR_HPP
#define CASTLINK_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace castlink
{

using nlohmann::json;

// Base of every recoverable failure reported by the library.
// Programmer errors (null listener, empty ids, ...) are reported as std::invalid_argument instead.
class cast_error : public std::runtime_error
{
public:
    explicit cast_error(const std::string& what)
        : std::runtime_error {what}
    {}
};

class connection_error : public cast_error
{
public:

    enum class reason
    {
        refused,
        timed_out,
        handshake_failed,
        closed,
        already_connected,
        not_connected
    };

    connection_error(reason r, const std::string& what)
        : cast_error {what}, m_reason {r}
    {}

    reason get_reason() const noexcept
    {
        return m_reason;
    }

private:

    reason m_reason;

};

class framing_error : public cast_error
{
public:

    enum class reason
    {
        truncated_length,
        truncated_payload,
        too_large
    };

    framing_error(reason r, const std::string& what, uint64_t expected = 0, uint64_t received = 0)
        : cast_error {what}, m_reason {r}, m_expected {expected}, m_received {received}
    {}

    reason get_reason() const noexcept
    {
        return m_reason;
    }

    // Number of bytes the frame header declared (or 4 for a truncated header)
    uint64_t expected() const noexcept
    {
        return m_expected;
    }

    uint64_t received() const noexcept
    {
        return m_received;
    }

private:

    reason m_reason;

    uint64_t m_expected;

    uint64_t m_received;

};

class decode_error : public cast_error
{
public:
    decode_error(const std::string& what, std::string raw)
        : cast_error {what}, m_raw {std::move(raw)}
    {}

    // The unparsed input, kept for diagnostics
    const std::string& raw() const noexcept
    {
        return m_raw;
    }

private:

    std::string m_raw;

};

class timeout_error : public cast_error
{
public:
    timeout_error(const std::string& what, uint64_t request_id)
        : cast_error {what}, m_request_id {request_id}
    {}

    uint64_t request_id() const noexcept
    {
        return m_request_id;
    }

private:

    uint64_t m_request_id;

};

// The receiver answered with an explicit error payload (INVALID_REQUEST, LOAD_FAILED, LAUNCH_ERROR, ...)
class device_error : public cast_error
{
public:
    device_error(const std::string& what, std::string type, json payload)
        : cast_error {what}, m_type {std::move(type)}, m_payload(std::move(payload))
    {}

    const std::string& type() const noexcept
    {
        return m_type;
    }

    const json& payload() const noexcept
    {
        return m_payload;
    }

private:

    std::string m_type;

    json m_payload;

};

class unexpected_response_error : public cast_error
{
public:
    unexpected_response_error(const std::string& what, json response)
        : cast_error {what}, m_response(std::move(response))
    {}

    // The response as received, untyped
    const json& response() const noexcept
    {
        return m_response;
    }

private:

    json m_response;

};

} // namespace castlink

#endif
