#include <mizu/request.h>
#include <utility>

namespace mizu {

namespace http = boost::beast::http;

Request::Request() : payload_(std::make_shared<Payload>()) {}

Request::Request(std::string method, std::string_view target)
    : method(std::move(method)), payload_(std::make_shared<Payload>()) {
    set_target(target);
}

Request Request::from_beast(http::request<http::string_body>&& msg) {
    const auto verb = msg.method_string();
    const auto raw_target = msg.target();

    Request req(std::string(verb.data(), verb.size()),
                std::string_view(raw_target.data(), raw_target.size()));
    req.payload_->body = std::move(msg.body());
    // The target lives in the fields storage, so it is read before the move.
    req.payload_->headers = std::move(static_cast<http::fields&>(msg));
    return req;
}

void Request::set_target(std::string_view raw) {
    std::string_view rest = raw;

    // Absolute-form: drop "scheme://authority".
    if (!rest.starts_with('/')) {
        const size_t scheme_end = rest.find("://");
        if (scheme_end != std::string_view::npos) {
            rest.remove_prefix(scheme_end + 3);
            const size_t path_start = rest.find_first_of("/?#");
            rest = path_start == std::string_view::npos ? std::string_view{} : rest.substr(path_start);
        }
    }

    const size_t fragment_pos = rest.find('#');
    if (fragment_pos != std::string_view::npos) {
        rest = rest.substr(0, fragment_pos);
    }

    const size_t query_pos = rest.find('?');
    std::string_view pure_path = rest.substr(0, query_pos);
    query_string = query_pos == std::string_view::npos ? std::string() : std::string(rest.substr(query_pos + 1));

    path = pure_path.empty() ? std::string("/") : std::string(pure_path);
    target = query_string.empty() ? path : path + "?" + query_string;
}

Request Request::with_path(std::string_view new_path) const {
    Request copy = *this;
    copy.path = new_path.starts_with('/') ? std::string(new_path) : "/" + std::string(new_path);
    copy.target = query_string.empty() ? copy.path : copy.path + "?" + query_string;
    return copy;
}

std::string_view Request::get_header(std::string_view key) const {
    auto it = payload_->headers.find(std::string(key));
    if (it == payload_->headers.end()) {
        return {};
    }
    const auto value = it->value();
    return {value.data(), value.size()};
}

bool Request::has_header(std::string_view key) const {
    return payload_->headers.find(std::string(key)) != payload_->headers.end();
}

Request& Request::header(std::string_view key, std::string_view value) {
    payload_->headers.set(std::string(key), std::string(value));
    return *this;
}

Request& Request::set_body(std::string body) {
    payload_->body = std::move(body);
    return *this;
}

} // namespace mizu
