#include <mizu/router.h>
#include <mizu/dispatcher.h>
#include <mizu/logger.h>
#include <mizu/util/path.h>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace mizu {

Router::Router(RouterConfig config) : config_(std::move(config)) {}

void Router::use(const Middleware& mw) {
    middleware_.push_back(mw);
}

void Router::add_route(std::string_view method, std::string_view path, const Handler& handler,
                       const std::vector<Middleware>& middleware) {
    if (!handler) {
        throw std::invalid_argument("Route " + std::string(method) + " " + std::string(path) + " has no handler");
    }

    // Snapshot: global middleware registered later must not reach this route.
    Route route;
    route.middleware.reserve(middleware_.size() + middleware.size());
    route.middleware.insert(route.middleware.end(), middleware_.begin(), middleware_.end());
    route.middleware.insert(route.middleware.end(), middleware.begin(), middleware.end());
    route.handler = handler;

    trees_[std::string(method)].insert(path, std::move(route), config_.strict_patterns);

    Logger::instance().log(LogLevel::DEBUG,
        "Registered " + std::string(method) + " " + std::string(path) +
        " (" + std::to_string(middleware_.size() + middleware.size()) + " middleware)");
}

void Router::get(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route("GET", path, handler, middleware);
}

void Router::post(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route("POST", path, handler, middleware);
}

void Router::put(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route("PUT", path, handler, middleware);
}

void Router::patch(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route("PATCH", path, handler, middleware);
}

void Router::del(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route("DELETE", path, handler, middleware);
}

void Router::head(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route("HEAD", path, handler, middleware);
}

void Router::options(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route("OPTIONS", path, handler, middleware);
}

void Router::all(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware) {
    add_route(any_method, path, handler, middleware);
}

void Router::mount(std::string_view prefix, std::shared_ptr<const Router> child) {
    if (!child) {
        throw std::invalid_argument("Cannot mount a null router at " + std::string(prefix));
    }

    std::string pattern(prefix);
    pattern += pattern.ends_with('/') ? "*" : "/*";

    Handler delegate = [child, strip = std::string(prefix)](Context& ctx, Next) -> Async<Result> {
        Request forwarded = ctx.req.with_path(util::strip_prefix(ctx.req.path, strip));
        co_return co_await child->handle(std::move(forwarded), ctx.env, ctx.store);
    };

    Logger::instance().log(LogLevel::DEBUG, "Mounting sub-router at " + pattern);
    add_route(any_method, pattern, delegate);
}

std::optional<RouteMatch> Router::match_tree(std::string_view method,
                                             const std::vector<std::string_view>& segments) const {
    auto it = trees_.find(std::string(method));
    if (it == trees_.end()) {
        return std::nullopt;
    }
    return it->second.match(segments);
}

std::optional<RouteMatch> Router::match(std::string_view method, std::string_view path) const {
    const std::string_view pure_path = path.substr(0, path.find('?'));
    const auto segments = util::split_path(pure_path);

    if (auto found = match_tree(method, segments)) {
        return found;
    }
    return match_tree(any_method, segments);
}

Async<Response> Router::handle(Request req,
                               std::shared_ptr<const Store> env,
                               std::shared_ptr<Store> store) const {
    const auto start_time = std::chrono::steady_clock::now();

    Context ctx;
    ctx.query = util::parse_query(req.query_string);
    ctx.req = std::move(req);
    ctx.env = std::move(env);
    ctx.store = store ? std::move(store) : std::make_shared<Store>();

    Response res;
    auto found = match(ctx.req.method, ctx.req.path);
    if (!found) {
        res = Response(404, config_.not_found_body);
    } else {
        ctx.params = std::move(found->params);
        Dispatcher dispatcher(ctx, *found->route, config_.error_body);
        Result result = co_await dispatcher.run();
        if (result) {
            res = std::move(*result);
        }
    }

    const auto end_time = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    Logger::instance().log_access(ctx.req.method, ctx.req.path, res.get_status(), duration);

    co_return res;
}

} // namespace mizu
