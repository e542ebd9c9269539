#ifndef CASTLINK_TRANSPORT_HPP
#define CASTLINK_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace castlink
{

// Byte stream to a cast receiver. read() and write() are called from different threads,
// close() may be called from any thread and must make a blocked read() return.
class transport
{
public:
    virtual ~transport() = default;

    // Returns the number of bytes read, 0 once the stream is closed. Throws std::runtime_error on I/O errors.
    virtual size_t read(char* buffer, size_t len) = 0;

    // Writes the whole buffer or throws std::runtime_error
    virtual void write(const char* data, size_t len) = 0;

    virtual void close() = 0;
};

using transport_ptr = std::unique_ptr<transport>;

using transport_factory = std::function<transport_ptr(const std::string& host, uint16_t port)>;

struct tls_keypair_path
{
    std::string cert_path;
    std::string key_path;
};

// TLS over TCP. Cast receivers use self signed certificates, so the peer is not verified.
class tls_transport : public transport
{
public:

    tls_transport(const tls_transport&) = delete;
    tls_transport& operator=(const tls_transport&) = delete;
    tls_transport(tls_transport&&) = delete;
    tls_transport& operator=(tls_transport&&) = delete;
    ~tls_transport() override;

    // Connects and performs the TLS handshake, throws connection_error on failure
    tls_transport(const tls_keypair_path& keypair, const std::string& host, uint16_t port);

    size_t read(char* buffer, size_t len) override;

    void write(const char* data, size_t len) override;

    void close() override;

private:

    class impl;

    std::unique_ptr<impl> m_impl;

};

// Factory creating tls_transport instances with the given key pair
transport_factory make_tls_factory(tls_keypair_path keypair);

} // namespace castlink

#endif
