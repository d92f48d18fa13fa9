#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <memory>
#include <string_view>

namespace gp::protocols {

namespace asio  = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// Listening socket that hands every accepted connection, on its own strand, to onAccept().
class TcpServerBase : public std::enable_shared_from_this<TcpServerBase> {
public:
    TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint);
    virtual ~TcpServerBase() = default;

    // Starts accepting; the io_context must be run by the caller.
    void run();

protected:
    virtual std::string_view serverName() const noexcept = 0;
    virtual void onAccept(tcp::socket socket) = 0;

private:
    void listen(const tcp::endpoint& endpoint);
    void acceptNext();

    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
};

}
