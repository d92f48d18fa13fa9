#include "api/Response.hpp"

using namespace gp::api;

Response Response::SUCCESS(json&& body) {
    return {Status::OK, std::move(body)};
}

Response Response::IGNORED(std::string&& message) {
    return {Status::IGNORED, json{{"status", "ignored"}, {"message", std::move(message)}}};
}

Response Response::NOT_FOUND(std::string&& error) {
    return {Status::NOT_FOUND, json{{"error", std::move(error)}}};
}

Response Response::BAD_REQUEST(std::string&& error) {
    return {Status::BAD_REQUEST, json{{"error", std::move(error)}}};
}

Response Response::ERROR(std::string&& error) {
    return {Status::ERROR, json{{"error", std::move(error)}}};
}

std::string gp::api::to_string(const Status& status) {
    switch (status) {
        case Status::OK: return "ok";
        case Status::IGNORED: return "ignored";
        case Status::NOT_FOUND: return "not_found";
        case Status::BAD_REQUEST: return "bad_request";
        case Status::ERROR: return "error";
        default: return "unknown";
    }
}
