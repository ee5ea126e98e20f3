#include <mizu/dispatcher.h>
#include <mizu/exceptions.h>
#include <mizu/logger.h>
#include <exception>
#include <utility>

namespace mizu {

namespace {
    // Carries a handler exception up through the middleware frames that awaited
    // it. Must not derive from std::exception: catch clauses for std::exception,
    // ours or a middleware's own, have to let it pass.
    struct HandlerFailure {
        std::exception_ptr error;
    };
}

Dispatcher::Dispatcher(Context& ctx, const Route& route, std::string error_body)
    : ctx_(ctx), route_(route), error_body_(std::move(error_body)) {}

Async<Result> Dispatcher::run() {
    try {
        co_return co_await dispatch(0);
    } catch (const HandlerFailure& failure) {
        std::rethrow_exception(failure.error);
    }
}

Async<Result> Dispatcher::dispatch(std::size_t step) {
    if (static_cast<std::ptrdiff_t>(step) <= cursor_) {
        throw NextCalledTwice(step);
    }
    cursor_ = static_cast<std::ptrdiff_t>(step);

    if (step >= route_.middleware.size()) {
        co_return co_await invoke_handler();
    }

    const Middleware& mw = route_.middleware[step];
    Result downstream;
    Result result;

    try {
        result = co_await mw(ctx_, [this, step, &downstream]() {
            return proceed(step + 1, downstream);
        });
    } catch (const NextCalledTwice&) {
        throw;
    } catch (const HandlerFailure&) {
        throw;
    } catch (const std::exception& e) {
        Logger::instance().log_error("Middleware error at step " + std::to_string(step) + ": " + e.what());
        co_return Response(500, error_body_);
    } catch (...) {
        Logger::instance().log_error("Middleware error at step " + std::to_string(step) + ": unknown exception");
        co_return Response(500, error_body_);
    }

    if (result) {
        co_return result;
    }
    co_return downstream;
}

Async<Result> Dispatcher::proceed(std::size_t step, Result& downstream) {
    downstream = co_await dispatch(step);
    co_return downstream;
}

Async<Result> Dispatcher::invoke_handler() {
    const Next done = []() -> Async<Result> {
        co_return std::nullopt;
    };

    try {
        co_return co_await route_.handler(ctx_, done);
    } catch (...) {
        throw HandlerFailure{std::current_exception()};
    }
}

} // namespace mizu
