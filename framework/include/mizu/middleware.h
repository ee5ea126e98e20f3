#ifndef MIZU_MIDDLEWARE_H
#define MIZU_MIDDLEWARE_H

#include <string>
#include <variant>
#include <vector>
#include <mizu/context.h>

namespace mizu::middleware
{

    struct CorsOptions {
        // true allows any origin, false disables CORS, a string names one
        // origin ("*" allows any) and a list names several.
        std::variant<bool, std::string, std::vector<std::string>> origin = std::string("*");
        std::vector<std::string> methods = {"GET", "HEAD", "PUT", "PATCH", "POST", "DELETE"};
        std::vector<std::string> allowed_headers = {"Content-Type"};
        std::vector<std::string> exposed_headers;
        bool credentials = false;
        int max_age = 86400;                 // Seconds, 0 omits Access-Control-Max-Age
        bool preflight_continue = false;     // Pass OPTIONS requests down the chain
        int options_success_status = 204;
    };

    bool is_origin_allowed(std::string_view origin, const CorsOptions& options);

    // usage: router.use(middleware::cors());
    //        router.use(middleware::cors({.origin = std::vector<std::string>{"https://example.com"},
    //                                     .credentials = true}));
    Middleware cors(CorsOptions options = {});

}

#endif
