#include <mizu/middleware.h>
#include <mizu/util/string.h>
#include <algorithm>
#include <utility>

namespace mizu::middleware {

namespace {
    std::string allow_origin_value(std::string_view origin, const CorsOptions& options) {
        // A boolean setting answers with the wildcard instead of echoing the origin.
        return std::holds_alternative<bool>(options.origin) ? std::string("*") : std::string(origin);
    }

    bool contains(const std::vector<std::string>& items, std::string_view value) {
        return std::find(items.begin(), items.end(), value) != items.end();
    }

    std::string to_string(boost::beast::string_view view) {
        return {view.data(), view.size()};
    }
}

bool is_origin_allowed(std::string_view origin, const CorsOptions& options) {
    if (const bool* flag = std::get_if<bool>(&options.origin)) {
        return *flag;
    }
    if (const auto* single = std::get_if<std::string>(&options.origin)) {
        return *single == "*" || *single == origin;
    }
    return contains(std::get<std::vector<std::string>>(options.origin), origin);
}

Middleware cors(CorsOptions options) {
    return [opts = std::move(options)](Context& ctx, Next next) -> Async<Result> {
        const std::string origin(ctx.req.get_header("Origin"));

        if (util::to_upper(ctx.req.method) == "OPTIONS") {
            if (origin.empty() || !is_origin_allowed(origin, opts)) {
                co_return co_await next();
            }

            Response preflight(opts.options_success_status);
            preflight.header("Access-Control-Allow-Origin", allow_origin_value(origin, opts));

            if (opts.credentials) {
                preflight.header("Access-Control-Allow-Credentials", "true");
            }

            if (opts.max_age > 0) {
                preflight.header("Access-Control-Max-Age", std::to_string(opts.max_age));
            }

            const std::string_view request_method = ctx.req.get_header("Access-Control-Request-Method");
            if (!request_method.empty() && contains(opts.methods, util::to_upper(request_method))) {
                preflight.header("Access-Control-Allow-Methods", util::join(opts.methods, ", "));
            }

            if (ctx.req.has_header("Access-Control-Request-Headers")) {
                preflight.header("Access-Control-Allow-Headers", util::join(opts.allowed_headers, ", "));
            }

            if (!opts.exposed_headers.empty()) {
                preflight.header("Access-Control-Expose-Headers", util::join(opts.exposed_headers, ", "));
            }

            if (!opts.preflight_continue) {
                co_return preflight;
            }

            Result downstream = co_await next();
            if (!downstream) {
                co_return preflight;
            }
            for (const auto& field : preflight.headers()) {
                downstream->header(to_string(field.name_string()), to_string(field.value()));
            }
            co_return downstream;
        }

        Result downstream = co_await next();
        if (!downstream || origin.empty() || !is_origin_allowed(origin, opts)) {
            co_return downstream;
        }

        Response decorated = *downstream;
        decorated.header("Access-Control-Allow-Origin", allow_origin_value(origin, opts));

        if (opts.credentials) {
            decorated.header("Access-Control-Allow-Credentials", "true");
        }

        if (!opts.exposed_headers.empty()) {
            decorated.header("Access-Control-Expose-Headers", util::join(opts.exposed_headers, ", "));
        }

        co_return decorated;
    };
}

} // namespace mizu::middleware
