#ifndef MIZU_DISPATCHER_H
#define MIZU_DISPATCHER_H

#include <cstddef>
#include <string>
#include <mizu/context.h>
#include <mizu/trie.h>

namespace mizu {

/**
 * @brief Runs one route's middleware chain and handler for one request.
 *
 * Steps are numbered 0..N-1 for middleware and N for the handler. The cursor
 * starts at -1 and may only move forward: a continuation that would re-enter
 * a step already reached throws NextCalledTwice.
 *
 * Failure policy:
 * - a middleware that throws is logged and replaced by a generic 500 response;
 * - an exception thrown by the handler is not contained and reaches the
 *   caller of run() unchanged, even when it unwinds through middleware;
 * - NextCalledTwice always reaches the caller of run().
 *
 * A Dispatcher is single use. It borrows the context and the route, which
 * must outlive the awaitable returned by run().
 */
class Dispatcher {
private:
    Context& ctx_;
    const Route& route_;
    std::string error_body_;
    std::ptrdiff_t cursor_ = -1;

    Async<Result> dispatch(std::size_t step);
    Async<Result> proceed(std::size_t step, Result& downstream);
    Async<Result> invoke_handler();

public:
    Dispatcher(Context& ctx, const Route& route, std::string error_body = "Internal Server Error");

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /** @brief Executes the chain. An empty Result means nothing produced a response. */
    Async<Result> run();
};

} // namespace mizu

#endif
