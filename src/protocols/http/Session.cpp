#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace gp::log;

namespace gp::protocols::http {

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router, const std::uint64_t bodyLimit)
    : socket_(std::move(socket)), router_(std::move(router)), bodyLimit_(bodyLimit) {}

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(bodyLimit_);

    auto self = shared_from_this();
    http::async_read(socket_, buffer_, *parser_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

template <class Response>
void Session::send(Response&& res) {
    auto self = shared_from_this();
    auto msg = std::make_shared<std::decay_t<Response>>(std::forward<Response>(res));
    http::async_write(socket_, *msg,
                      [self, msg](beast::error_code ec, std::size_t bytes) {
                          self->on_write(msg->need_eof(), ec, bytes);
                      });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec == http::error::body_limit) {
        Registry::http()->warn("[Session] Request body exceeds {} bytes", bodyLimit_);
        string_response res{status::payload_too_large, 11};
        res.set(field::content_type, "application/json");
        res.set(field::access_control_allow_origin, "*");
        res.body() = nlohmann::json{{"error", "Request body too large"}}.dump();
        res.keep_alive(false);
        res.prepare_payload();
        return send(std::move(res));
    }

    if (ec) {
        Registry::http()->error("[Session] Read error: {}", ec.message());
        return do_close();
    }

    const auto req = parser_->release();
    Registry::http()->debug("[Session] Read {} bytes: {}", bytes,
                            std::string(req.target().data(), req.target().size()));

    send(router_->route(req));
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes; // unused

    if (ec) {
        Registry::http()->error("[Session] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected)
        Registry::http()->debug("[Session] Shutdown error: {}", ec.message());
}

}
