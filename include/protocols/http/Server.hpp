#pragma once

#include "protocols/TcpServerBase.hpp"

#include <cstdint>
#include <memory>

namespace gp::protocols::http {

namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;

class Server final : public TcpServerBase {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<const Router> router, std::uint64_t bodyLimit);

private:
    std::string_view serverName() const noexcept override { return "HttpServer"; }
    void onAccept(tcp::socket socket) override;

    std::shared_ptr<const Router> router_;
    std::uint64_t bodyLimit_;
};

}
