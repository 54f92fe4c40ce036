#include "http_server.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <iostream>
#include <thread>

namespace mockup::http_service {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Runs one asynchronous operation to completion so the stream's deadline
// applies; the caller still sees a blocking call.
template <class Start>
beast::error_code runToCompletion(net::io_context& ioc, Start&& start)
{
    beast::error_code result;
    start([&result](beast::error_code ec, std::size_t) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

bool isTransientAcceptError(const beast::error_code& ec)
{
    return ec == net::error::connection_aborted || ec == net::error::interrupted
        || ec == net::error::try_again || ec == net::error::no_descriptors
        || ec == net::error::no_buffer_space || ec == net::error::no_memory;
}

}

void serveConnection(net::io_context& ioc, tcp::socket socket, const ServerOptions& options,
                     const MockupService& service)
{
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    beast::error_code ec;

    for (;;)
    {
        http::request_parser<http::string_body> parser;
        parser.body_limit(options.bodyLimit);

        stream.expires_after(std::chrono::seconds(options.ioTimeoutSeconds));
        ec = runToCompletion(ioc, [&](auto handler) { http::async_read(stream, buffer, parser, handler); });
        if (ec == http::error::end_of_stream) break;
        if (ec)
        {
            if (ec == http::error::body_limit)
            {
                Response res{http::status::payload_too_large, 11};
                res.set(http::field::content_type, "text/plain; charset=utf-8");
                res.body() = "Upload too large";
                res.keep_alive(false);
                res.prepare_payload();
                stream.expires_after(std::chrono::seconds(options.ioTimeoutSeconds));
                ec = runToCompletion(ioc, [&](auto handler) { http::async_write(stream, res, handler); });
            }
            else if (ec != beast::error::timeout)
            {
                std::cerr << "[runServer] read: " << ec.message() << "\n";
            }
            break;
        }

        Request req = parser.release();
        auto started = std::chrono::steady_clock::now();
        Response res = service.handle(req);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
        std::cerr << "[runServer] " << req.method_string() << " " << req.target() << " -> "
                  << res.result_int() << " (" << ms << " ms)\n";

        const bool keepAlive = res.keep_alive();
        stream.expires_after(std::chrono::seconds(options.ioTimeoutSeconds));
        ec = runToCompletion(ioc, [&](auto handler) { http::async_write(stream, res, handler); });
        if (ec)
        {
            std::cerr << "[runServer] write: " << ec.message() << "\n";
            break;
        }
        if (!keepAlive) break;
    }

    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

bool runServer(const ServerOptions& options, const MockupService& service)
{
    net::io_context ioc{1};
    beast::error_code ec;

    auto address = net::ip::make_address(options.address, ec);
    if (ec)
    {
        std::cerr << "[runServer] bad address '" << options.address << "': " << ec.message() << "\n";
        return false;
    }

    tcp::endpoint endpoint{address, options.port};
    tcp::acceptor acceptor{ioc};
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor.bind(endpoint, ec);
    if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
    {
        std::cerr << "[runServer] cannot listen on " << options.address << ":" << options.port
                  << ": " << ec.message() << "\n";
        return false;
    }

    std::cout << "Listening on http://" << options.address << ":" << options.port << "/" << std::endl;
    for (;;)
    {
        tcp::socket socket{ioc};
        acceptor.accept(socket, ec);
        if (ec)
        {
            std::cerr << "[runServer] accept: " << ec.message() << "\n";
            if (!isTransientAcceptError(ec)) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        serveConnection(ioc, std::move(socket), options, service);
    }
}

}
