#include <catch2/catch_test_macros.hpp>
#include <mizu/dispatcher.h>
#include <mizu/exceptions.h>
#include <mizu/router.h>
#include <string>
#include <vector>
#include "test_support.h"

using namespace mizu;
using test::respond;
using test::serve;

namespace {
    Middleware record(std::vector<std::string>& trace, std::string name) {
        return [&trace, name](Context&, Next next) -> Async<Result> {
            trace.push_back(name);
            co_return co_await next();
        };
    }

    struct CustomFailure : std::runtime_error {
        CustomFailure() : std::runtime_error("handler exploded") {}
    };
}

TEST_CASE("Dispatcher: Execution order", "[dispatcher]") {
    Router router;
    std::vector<std::string> trace;

    router.use(record(trace, "global1"));
    router.use(record(trace, "global2"));

    router.get("/test", [&trace](Context&, Next) -> Async<Result> {
        trace.push_back("handler");
        co_return Response(200, "Test");
    }, {record(trace, "route")});

    SECTION("Global middleware runs first, then route middleware, then the handler") {
        auto res = serve(router, "GET", "/test");
        CHECK(res.body() == "Test");
        CHECK(trace == std::vector<std::string>{"global1", "global2", "route", "handler"});
    }

    SECTION("Middleware resumes after next() in reverse order") {
        Router onion;
        std::vector<int> order;

        onion.use([&order](Context&, Next next) -> Async<Result> {
            order.push_back(1);
            auto res = co_await next();
            order.push_back(5);
            co_return res;
        });
        onion.use([&order](Context&, Next next) -> Async<Result> {
            order.push_back(2);
            co_await next();
            order.push_back(4);
            co_return std::nullopt;
        });
        onion.get("/", [&order](Context&, Next) -> Async<Result> {
            order.push_back(3);
            co_return Response(200, "OK");
        });

        auto res = serve(onion, "GET", "/");
        CHECK(res.body() == "OK");
        CHECK(order == std::vector<int>{1, 2, 3, 4, 5});
    }
}

TEST_CASE("Dispatcher: Global middleware is snapshotted at registration", "[dispatcher]") {
    Router router;
    int hits = 0;

    router.get("/a", respond("A"));
    router.use([&hits](Context&, Next next) -> Async<Result> {
        ++hits;
        co_return co_await next();
    });
    router.get("/b", respond("B"));

    CHECK(serve(router, "GET", "/a").body() == "A");
    CHECK(hits == 0);

    CHECK(serve(router, "GET", "/b").body() == "B");
    CHECK(hits == 1);

    auto a = router.match("GET", "/a");
    auto b = router.match("GET", "/b");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->route->middleware.empty());
    CHECK(b->route->middleware.size() == 1);
}

TEST_CASE("Dispatcher: Short-circuit and continuation results", "[dispatcher]") {
    Router router;
    std::vector<std::string> trace;

    SECTION("A middleware response stops the chain") {
        router.use([](Context& ctx, Next next) -> Async<Result> {
            if (!ctx.req.has_header("Authorization")) {
                co_return Response(401, "Unauthorized");
            }
            co_return co_await next();
        });
        router.use(record(trace, "second"));
        router.get("/secret", [&trace](Context&, Next) -> Async<Result> {
            trace.push_back("handler");
            co_return Response(200, "secret");
        });

        auto res = serve(router, "GET", "/secret");
        CHECK(res.get_status() == 401);
        CHECK(trace.empty());

        Request authed("GET", "/secret");
        authed.header("Authorization", "Bearer token");
        CHECK(serve(router, authed).body() == "secret");
        CHECK(trace == std::vector<std::string>{"second", "handler"});
    }

    SECTION("Returning nothing after next() passes the downstream response upward") {
        router.use([](Context&, Next next) -> Async<Result> {
            co_await next();
            co_return std::nullopt;
        });
        router.get("/pass", respond("from handler", 201));

        auto res = serve(router, "GET", "/pass");
        CHECK(res.get_status() == 201);
        CHECK(res.body() == "from handler");
    }

    SECTION("Middleware can replace the downstream response") {
        router.use([](Context&, Next next) -> Async<Result> {
            auto res = co_await next();
            if (res) {
                res->header("X-Wrapped", "yes");
            }
            co_return res;
        });
        router.get("/wrap", respond("body"));

        auto res = serve(router, "GET", "/wrap");
        CHECK(res.get_header("X-Wrapped") == "yes");
        CHECK(res.body() == "body");
    }

    SECTION("Middleware that never calls next() and returns nothing ends the chain") {
        router.use([](Context&, Next) -> Async<Result> {
            co_return std::nullopt;
        });
        router.get("/quiet", [&trace](Context&, Next) -> Async<Result> {
            trace.push_back("handler");
            co_return Response(200, "unreachable");
        });

        auto res = serve(router, "GET", "/quiet");
        CHECK(res.get_status() == 200);
        CHECK(res.body().empty());
        CHECK(trace.empty());
    }

    SECTION("The handler's continuation is a no-op") {
        router.get("/noop", [](Context&, Next next) -> Async<Result> {
            auto first = co_await next();
            auto second = co_await next();
            co_return Response(200, (first || second) ? "unexpected" : "done");
        });

        CHECK(serve(router, "GET", "/noop").body() == "done");
    }
}

TEST_CASE("Dispatcher: next() called twice", "[dispatcher]") {
    Router router;
    int handler_runs = 0;

    router.use([](Context&, Next next) -> Async<Result> {
        co_await next();
        co_return co_await next();
    });
    router.get("/twice", [&handler_runs](Context&, Next) -> Async<Result> {
        ++handler_runs;
        co_return Response(200, "once");
    });

    SECTION("Dispatch aborts with a distinct error") {
        CHECK_THROWS_AS(serve(router, "GET", "/twice"), NextCalledTwice);
        CHECK(handler_runs == 1);
    }

    SECTION("The error names the step and is not turned into a 500") {
        try {
            serve(router, "GET", "/twice");
            FAIL("expected NextCalledTwice");
        } catch (const NextCalledTwice& e) {
            CHECK(e.step() == 1);
            CHECK(std::string(e.what()) == "next() called multiple times");
        }
    }

    SECTION("Outer middleware cannot mask the error") {
        Router nested;
        std::vector<std::string> outer_trace;
        nested.use(record(outer_trace, "outer"));
        nested.use([](Context&, Next next) -> Async<Result> {
            co_await next();
            co_return co_await next();
        });
        nested.get("/x", respond("x"));
        CHECK_THROWS_AS(serve(nested, "GET", "/x"), NextCalledTwice);
    }
}

TEST_CASE("Dispatcher: Middleware failures", "[dispatcher]") {
    Router router;
    bool handler_ran = false;

    SECTION("A throwing middleware yields a generic 500 and skips the handler") {
        router.use([](Context&, Next) -> Async<Result> {
            throw std::runtime_error("database password is hunter2");
            co_return std::nullopt;
        });
        router.get("/test", [&handler_ran](Context&, Next) -> Async<Result> {
            handler_ran = true;
            co_return Response(200, "Test");
        });

        auto res = serve(router, "GET", "/test");
        CHECK(res.get_status() == 500);
        CHECK(res.body() == "Internal Server Error");
        CHECK(res.body().find("hunter2") == std::string::npos);
        CHECK_FALSE(handler_ran);
    }

    SECTION("Exceptions of any type are contained") {
        router.use([](Context&, Next) -> Async<Result> {
            throw 42;
            co_return std::nullopt;
        });
        router.get("/test", respond("Test"));

        CHECK(serve(router, "GET", "/test").get_status() == 500);
    }

    SECTION("A failure after next() still yields 500") {
        router.use([](Context&, Next next) -> Async<Result> {
            co_await next();
            throw std::runtime_error("post-processing failed");
        });
        router.get("/test", respond("Test"));

        CHECK(serve(router, "GET", "/test").get_status() == 500);
    }

    SECTION("Upstream middleware sees the 500 produced for a downstream failure") {
        int seen_status = 0;
        router.use([&seen_status](Context&, Next next) -> Async<Result> {
            auto res = co_await next();
            seen_status = res ? res->get_status() : -1;
            co_return res;
        });
        router.use([](Context&, Next) -> Async<Result> {
            throw std::logic_error("inner");
            co_return std::nullopt;
        });
        router.get("/test", respond("Test"));

        CHECK(serve(router, "GET", "/test").get_status() == 500);
        CHECK(seen_status == 500);
    }
}

TEST_CASE("Dispatcher: Handler failures propagate", "[dispatcher]") {
    Router router;

    SECTION("Without middleware") {
        router.get("/boom", [](Context&, Next) -> Async<Result> {
            throw CustomFailure();
            co_return std::nullopt;
        });
        CHECK_THROWS_AS(serve(router, "GET", "/boom"), CustomFailure);
    }

    SECTION("Through middleware that awaited next()") {
        bool after_next = false;
        router.use([&after_next](Context&, Next next) -> Async<Result> {
            auto res = co_await next();
            after_next = true;
            co_return res;
        });
        router.get("/boom", [](Context&, Next) -> Async<Result> {
            throw CustomFailure();
            co_return std::nullopt;
        });

        CHECK_THROWS_AS(serve(router, "GET", "/boom"), CustomFailure);
        CHECK_FALSE(after_next);
    }

    SECTION("Middleware catching std::exception does not intercept it") {
        router.use([](Context&, Next next) -> Async<Result> {
            try {
                co_return co_await next();
            } catch (const std::exception&) {
                co_return Response(418, "swallowed");
            }
        });
        router.get("/boom", [](Context&, Next) -> Async<Result> {
            throw CustomFailure();
            co_return std::nullopt;
        });

        CHECK_THROWS_AS(serve(router, "GET", "/boom"), CustomFailure);
    }
}

TEST_CASE("Dispatcher: Direct use", "[dispatcher]") {
    Context ctx;
    ctx.req = Request("GET", "/direct");

    Route route;
    route.middleware.push_back([](Context& c, Next next) -> Async<Result> {
        c.params["seen"] = "yes";
        co_return co_await next();
    });
    route.handler = [](Context& c, Next) -> Async<Result> {
        co_return Response(200, std::string(c.param("seen")));
    };

    SECTION("Runs the chain against the given context") {
        Dispatcher dispatcher(ctx, route);
        auto result = test::run_sync(dispatcher.run());
        REQUIRE(result.has_value());
        CHECK(result->body() == "yes");
    }

    SECTION("Uses the configured error body") {
        route.middleware.insert(route.middleware.begin(), [](Context&, Next) -> Async<Result> {
            throw std::runtime_error("fail");
            co_return std::nullopt;
        });
        Dispatcher dispatcher(ctx, route, "custom error");
        auto result = test::run_sync(dispatcher.run());
        REQUIRE(result.has_value());
        CHECK(result->get_status() == 500);
        CHECK(result->body() == "custom error");
    }
}
