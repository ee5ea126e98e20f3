#include <mizu/response.h>
#include <boost/json/src.hpp>
#include <sstream>

namespace mizu {

namespace http = boost::beast::http;

Response::Response() {
    res_.version(11);
    res_.result(http::status::ok);
}

Response::Response(int code, std::string body) : Response() {
    status(code);
    res_.body() = std::move(body);
}

Response& Response::status(int code) {
    res_.result(static_cast<unsigned>(code));
    return *this;
}

Response& Response::header(const std::string& key, const std::string& value) {
    res_.set(key, value);
    return *this;
}

Response& Response::add_header(const std::string& key, const std::string& value) {
    res_.insert(key, value);
    return *this;
}

Response& Response::send(const std::string& text) {
    res_.body() = text;
    return *this;
}

Response& Response::json(const boost::json::value& data) {
    header("Content-Type", "application/json");
    res_.body() = boost::json::serialize(data);
    return *this;
}

Response& Response::no_content() {
    status(204);
    res_.body().clear();
    return *this;
}

Response& Response::redirect(const std::string& url, int code) {
    status(code);
    header("Location", url);
    return *this;
}

int Response::get_status() const {
    return static_cast<int>(res_.result_int());
}

std::string_view Response::get_header(std::string_view key) const {
    auto it = res_.find(std::string(key));
    if (it == res_.end()) {
        return {};
    }
    const auto value = it->value();
    return {value.data(), value.size()};
}

bool Response::has_header(std::string_view key) const {
    return res_.find(std::string(key)) != res_.end();
}

std::string Response::build_response() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << res_.result_int() << " " << http::obsolete_reason(res_.result()) << "\r\n";

    for (const auto& field : res_) {
        oss << field.name_string() << ": " << field.value() << "\r\n";
    }

    if (res_.find(http::field::content_length) == res_.end()) {
        oss << "Content-Length: " << res_.body().length() << "\r\n";
    }

    oss << "\r\n";
    oss << res_.body();
    return oss.str();
}

http::response<http::string_body> Response::to_beast() const {
    auto msg = res_;
    msg.prepare_payload();
    return msg;
}

} // namespace mizu
