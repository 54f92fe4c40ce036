#pragma once
#include "mockup_service.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <string>

namespace mockup::http_service {

struct ServerOptions
{
    std::string address {"0.0.0.0"};
    unsigned short port {5100};
    int ioTimeoutSeconds {30};                 // per read/write on a connection
    std::uint64_t bodyLimit {64ull * 1024 * 1024};
};

// Answers requests on an accepted `socket` until the peer closes, asks to
// close, or stalls past `options.ioTimeoutSeconds`. Bodies over
// `options.bodyLimit` get 413. `socket` must belong to `ioc`; the call blocks.
void serveConnection(boost::asio::io_context& ioc, boost::asio::ip::tcp::socket socket,
                     const ServerOptions& options, const MockupService& service);

// Accepts connections one at a time and answers them with `service` until the
// listener fails. Returns false when the listener could not be opened or
// accept fails with a non-transient error; running out of descriptors or
// memory only pauses accepting.
bool runServer(const ServerOptions& options, const MockupService& service);

}
