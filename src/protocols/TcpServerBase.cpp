#include "protocols/TcpServerBase.hpp"
#include "log/Registry.hpp"

#include <boost/system/system_error.hpp>
#include <stdexcept>
#include <string>

using namespace gp::log;

namespace gp::protocols {

TcpServerBase::TcpServerBase(asio::io_context& ioc, const tcp::endpoint& endpoint)
    : ioc_(ioc), acceptor_(ioc) { listen(endpoint); }

void TcpServerBase::listen(const tcp::endpoint& endpoint) {
    const auto where = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    const char* step = "open";

    try {
        acceptor_.open(endpoint.protocol());
        step = "set reuse_address on";
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        step = "bind";
        acceptor_.bind(endpoint);
        step = "listen on";
        acceptor_.listen(asio::socket_base::max_listen_connections);
    } catch (const boost::system::system_error& e) {
        throw std::runtime_error(std::string("Failed to ") + step + " " + where + ": " + e.what());
    }
}

void TcpServerBase::run() {
    const auto ep = acceptor_.local_endpoint();
    Registry::http()->info("[{}] Listening on {}:{}", serverName(), ep.address().to_string(), ep.port());
    acceptNext();
}

void TcpServerBase::acceptNext() {
    acceptor_.async_accept(asio::make_strand(ioc_),
        [self = shared_from_this()](const beast::error_code& ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) return;
            self->acceptNext();

            if (ec) {
                Registry::http()->debug("[{}] Accept error: {}", self->serverName(), ec.message());
                return;
            }

            self->onAccept(std::move(socket));
        });
}

}
