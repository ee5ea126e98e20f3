/**
 * Example: Worker
 *
 * Builds a small router and pushes a handful of requests through it without
 * a network listener, printing each response as it would go on the wire.
 * Concepts:
 * - Environment values and a per-request store
 * - Order-sensitive global middleware
 * - A sub-router mounted under /users with :id and ?format=
 * - Wildcard captures
 * - The CORS middleware
 */

#include <mizu/environment.h>
#include <mizu/logger.h>
#include <mizu/middleware.h>
#include <mizu/router.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>
#include <iostream>
#include <vector>

using namespace mizu;
namespace http = boost::beast::http;

namespace {

Response store_snapshot(const Context& ctx) {
    Response res;
    res.json({
        {"secret", ctx.env->get<std::string>("SECRET")},
        {"store", ctx.store->get<std::string>("local_secret")}
    });
    return res;
}

Async<void> serve_all(const Router& router,
                      std::vector<http::request<http::string_body>> requests,
                      std::shared_ptr<const Store> env) {
    for (auto& msg : requests) {
        Request req = Request::from_beast(std::move(msg));
        const std::string line = req.method + " " + req.target;

        // Every request starts with its own store.
        Response res = co_await router.handle(std::move(req), env, std::make_shared<Store>());
        std::cout << "> " << line << "\n" << res.build_response() << "\n\n";
    }
}

http::request<http::string_body> make_request(http::verb verb, const std::string& target,
                                              const std::string& origin = "") {
    http::request<http::string_body> msg{verb, target, 11};
    msg.set(http::field::host, "localhost");
    if (!origin.empty()) {
        msg.set(http::field::origin, origin);
        msg.set(http::field::access_control_request_method, "GET");
    }
    return msg;
}

} // namespace

int main() {
    // 1. Ambient setup
    load_env();
    Logger::instance().configure(env<std::string>("MIZU_LOG", std::string("stdout")));
    Logger::instance().set_level(LogLevel::DEBUG);

    auto environment = std::make_shared<Store>();
    environment->set("SECRET", env<std::string>("SECRET", std::string("worker-secret")));

    Router router(RouterConfig::from_env());
    router.use(middleware::cors({.origin = std::vector<std::string>{"https://app.example"}}));

    // 2. Middleware that initialises the store
    router.use([](Context& ctx, Next next) -> Async<Result> {
        ctx.store->set("local_secret", std::string("hello world - initial store"));
        co_return co_await next();
    });

    // Registered before the next use(), so it sees the initial value.
    router.get("/", [](Context& ctx, Next) -> Async<Result> {
        co_return store_snapshot(ctx);
    });

    // 3. Middleware that updates the store, for routes registered from here on
    router.use([](Context& ctx, Next next) -> Async<Result> {
        ctx.store->set("local_secret", std::string("updated store"));
        co_return co_await next();
    });

    router.get("/updated", [](Context& ctx, Next) -> Async<Result> {
        co_return store_snapshot(ctx);
    });

    // 4. Sub-router with a dynamic parameter and a query value
    auto users = std::make_shared<Router>();
    users->get("/:id", [](Context& ctx, Next) -> Async<Result> {
        Response res;
        res.json({
            {"user_id", std::string(ctx.param("id"))},
            {"secret", ctx.env->get<std::string>("SECRET")},
            {"local_secret", ctx.store->get<std::string>("local_secret")},
            {"format", ctx.get_query("format", "json")}
        });
        co_return res;
    });
    router.mount("/users", users);

    // 5. Wildcard route
    router.get("/wildcard/*", [](Context& ctx, Next) -> Async<Result> {
        boost::json::object captured;
        for (const auto& [name, value] : ctx.params) {
            captured[name] = value;
        }
        Response res;
        res.json({{"message", "wildcard route"}, {"path", captured}});
        co_return res;
    });

    std::vector<http::request<http::string_body>> requests;
    requests.push_back(make_request(http::verb::get, "/"));
    requests.push_back(make_request(http::verb::get, "/updated"));
    requests.push_back(make_request(http::verb::get, "/users/42?format=xml", "https://app.example"));
    requests.push_back(make_request(http::verb::options, "/users/42", "https://app.example"));
    requests.push_back(make_request(http::verb::get, "/wildcard/a/b/c"));
    requests.push_back(make_request(http::verb::get, "/missing"));

    boost::asio::io_context ioc;
    boost::asio::co_spawn(ioc, serve_all(router, std::move(requests), environment),
        [](std::exception_ptr e) {
            if (e) {
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    Logger::instance().log_error(std::string("Worker failed: ") + ex.what());
                }
            }
        });
    ioc.run();

    return 0;
}
