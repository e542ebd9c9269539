#include "castlink/transport.hpp"

#include <atomic>
#include <stdexcept>

#include <sys/socket.h>

#include "socketwrapper.hpp"

#include "castlink/error.hpp"
#include "castlink/log.hpp"

namespace castlink
{

class tls_transport::impl
{
public:

    impl(const tls_keypair_path& keypair, const std::string& host, uint16_t port)
        : m_sock {keypair.cert_path, keypair.key_path, host, port}
    {}

    size_t read(char* buffer, size_t len)
    {
        if(m_closed.load())
            return 0;
        return m_sock.read(net::span {buffer, len});
    }

    void write(const char* data, size_t len)
    {
        if(m_closed.load())
            throw std::runtime_error {"Socket already closed"};

        for(size_t bw = 0; bw < len; )
        {
            size_t n = m_sock.send(net::span {data + bw, len - bw});
            if(n == 0)
                throw std::runtime_error {"Remote socket closed"};
            bw += n;
        }
    }

    void close()
    {
        if(m_closed.exchange(true))
            return;

        // Wakes up a reader blocked in the tls layer, the descriptor itself is released by the destructor
        ::shutdown(m_sock.get(), SHUT_RDWR);
    }

private:

    net::tls_connection<net::ip_version::v4> m_sock;

    std::atomic<bool> m_closed {false};

};

tls_transport::tls_transport(const tls_keypair_path& keypair, const std::string& host, uint16_t port)
{
    try {
        m_impl = std::make_unique<impl>(keypair, host, port);
    } catch(std::runtime_error& e) {
        throw connection_error {connection_error::reason::refused,
            fmt::format("Unable to connect to {}:{}: {}", host, port, e.what())};
    }
}

tls_transport::~tls_transport()
{
    if(m_impl)
        m_impl->close();
}

size_t tls_transport::read(char* buffer, size_t len)
{
    return m_impl->read(buffer, len);
}

void tls_transport::write(const char* data, size_t len)
{
    m_impl->write(data, len);
}

void tls_transport::close()
{
    m_impl->close();
}

transport_factory make_tls_factory(tls_keypair_path keypair)
{
    return [keypair = std::move(keypair)](const std::string& host, uint16_t port) -> transport_ptr
    {
        log::debug("Opening TLS connection to {}:{}", host, port);
        return std::make_unique<tls_transport>(keypair, host, port);
    };
}

} // namespace castlink
