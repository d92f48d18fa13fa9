#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"

namespace gp::protocols::http {

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const Router> router, const std::uint64_t bodyLimit)
    : TcpServerBase(ioc, endpoint),
      router_(std::move(router)), bodyLimit_(bodyLimit) {}

void Server::onAccept(tcp::socket socket) {
    std::make_shared<Session>(std::move(socket), router_, bodyLimit_)->run();
}

}
