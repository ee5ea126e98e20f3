#ifndef MIZU_REQUEST_H
#define MIZU_REQUEST_H

#include <memory>
#include <string>
#include <string_view>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace mizu {

/**
 * @brief Inbound request descriptor.
 *
 * Headers and body live in a payload shared between copies, so rewriting the
 * path for a mounted router forwards the original body instead of duplicating it.
 */
struct Request {
    std::string method = "GET";
    std::string target = "/";
    std::string path = "/";
    std::string query_string;

    Request();
    Request(std::string method, std::string_view target);

    static Request from_beast(boost::beast::http::request<boost::beast::http::string_body>&& msg);

    // Accepts origin-form ("/a?b=1") and absolute-form ("http://host/a?b=1") targets.
    void set_target(std::string_view target);

    // Same method, query, headers and body; only the path changes. A missing
    // leading '/' is added.
    [[nodiscard]] Request with_path(std::string_view new_path) const;

    boost::beast::http::fields& headers() { return payload_->headers; }
    const boost::beast::http::fields& headers() const { return payload_->headers; }

    std::string_view get_header(std::string_view key) const;
    bool has_header(std::string_view key) const;
    Request& header(std::string_view key, std::string_view value);

    const std::string& body() const { return payload_->body; }
    Request& set_body(std::string body);

    bool shares_payload_with(const Request& other) const { return payload_ == other.payload_; }

private:
    struct Payload {
        boost::beast::http::fields headers;
        std::string body;
    };

    std::shared_ptr<Payload> payload_;
};

} // namespace mizu

#endif
