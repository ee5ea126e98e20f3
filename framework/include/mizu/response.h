#ifndef MIZU_RESPONSE_H
#define MIZU_RESPONSE_H

#include <string>
#include <string_view>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/json.hpp>

namespace mizu {

class Response {
private:
    boost::beast::http::response<boost::beast::http::string_body> res_;

public:
    Response();
    explicit Response(int code, std::string body = "");

    Response& status(int code);
    Response& header(const std::string& key, const std::string& value);
    Response& add_header(const std::string& key, const std::string& value);

    Response& send(const std::string& text);
    Response& json(const boost::json::value& data);

    // Helper methods for common response patterns
    Response& no_content();
    Response& redirect(const std::string& url, int code = 302);

    int get_status() const;
    const std::string& body() const { return res_.body(); }

    std::string_view get_header(std::string_view key) const;
    bool has_header(std::string_view key) const;

    const boost::beast::http::fields& headers() const { return res_; }
    boost::beast::http::fields& headers() { return res_; }

    std::string build_response() const;
    boost::beast::http::response<boost::beast::http::string_body> to_beast() const;
};

} // namespace mizu

#endif
