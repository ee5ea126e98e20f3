#ifndef MIZU_CONTEXT_H
#define MIZU_CONTEXT_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <boost/asio/awaitable.hpp>
#include <mizu/request.h>
#include <mizu/response.h>
#include <mizu/store.h>

namespace mizu {

template <typename T = void>
using Async = boost::asio::awaitable<T>;

// An engaged Result is a terminal response; nullopt lets the chain continue.
using Result = std::optional<Response>;

using Params = std::unordered_map<std::string, std::string>;
using Query = std::unordered_map<std::string, std::string>;

/**
 * @brief Per-request state handed to every middleware and to the handler.
 *
 * A Context is created for one request and discarded with it. Only the store
 * is meant to be shared, and only by reference.
 */
struct Context {
    Request req;
    Params params;
    Query query;
    std::shared_ptr<const Store> env;
    std::shared_ptr<Store> store;

    /** @brief Captured path parameter, or an empty view when it was not captured. */
    std::string_view param(const std::string& name) const;

    std::string get_query(const std::string& key, const std::string& default_val = "") const;
    int get_query_int(const std::string& key, int default_val = 0) const;
};

using Next = std::function<Async<Result>()>;

/**
 * @brief The one function shape shared by middleware and handlers.
 *
 * Returning a Response short-circuits; returning std::nullopt continues, in
 * which case whatever the awaited continuation produced is passed upward.
 */
using Middleware = std::function<Async<Result>(Context&, Next)>;
using Handler = Middleware;

} // namespace mizu

#endif
