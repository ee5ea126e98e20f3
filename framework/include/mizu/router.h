#ifndef MIZU_ROUTER_H
#define MIZU_ROUTER_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <mizu/config.h>
#include <mizu/context.h>
#include <mizu/trie.h>

namespace mizu {

// Method token of the catch-all tree, consulted after the method's own tree.
inline constexpr std::string_view any_method = "*";

/**
 * @brief Trie-based HTTP router with registration-time middleware snapshots.
 *
 * Lifecycle is build-then-serve: register routes and middleware first, then
 * call handle() from as many concurrent requests as needed. Registration is
 * not synchronised against serving.
 *
 * Global middleware is captured when a route is registered. A middleware
 * added with use() applies to routes registered after that call only.
 */
class Router {
private:
    RouterConfig config_;
    std::unordered_map<std::string, Trie> trees_;
    std::vector<Middleware> middleware_;

    std::optional<RouteMatch> match_tree(std::string_view method, const std::vector<std::string_view>& segments) const;

public:
    explicit Router(RouterConfig config = {});

    /** @brief Access the router configuration. */
    const RouterConfig& config() const { return config_; }

    Router& strict_patterns(bool strict) { config_.strict_patterns = strict; return *this; }

    /**
     * @brief Registers global middleware for every route registered after this call.
     */
    void use(const Middleware& mw);

    /**
     * @brief Binds @p handler, preceded by the current global middleware and then
     * @p middleware, to @p method and @p path.
     *
     * Patterns are '/'-separated; ":name" captures one segment and a trailing
     * "*" captures the rest of the path under "*".
     *
     * @throws std::invalid_argument if @p handler is empty.
     * @throws InvalidPattern in strict mode for ambiguous patterns.
     */
    void add_route(std::string_view method, std::string_view path, const Handler& handler,
                   const std::vector<Middleware>& middleware = {});

    /** @brief Registers a GET route. */
    void get(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});

    /** @brief Registers a POST route. */
    void post(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});

    /** @brief Registers a PUT route. */
    void put(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});

    /** @brief Registers a PATCH route. */
    void patch(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});

    /** @brief Registers a DELETE route. */
    void del(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});

    void head(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});
    void options(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});

    /** @brief Registers a route in the catch-all tree, matched for any method. */
    void all(std::string_view path, const Handler& handler, const std::vector<Middleware>& middleware = {});

    /**
     * @brief Delegates every request under @p prefix to @p child.
     *
     * The child sees the path with @p prefix stripped ("/" when nothing is
     * left), the same headers and body, the same environment and the same
     * store instance. The route lives in the catch-all tree and carries the
     * parent's global middleware registered so far; the child's own global
     * middleware applies inside the child.
     */
    void mount(std::string_view prefix, std::shared_ptr<const Router> child);

    /**
     * @brief Finds the route for @p method and @p path, falling back to the catch-all tree.
     * A "?query" suffix on @p path is ignored.
     */
    [[nodiscard]] std::optional<RouteMatch> match(std::string_view method, std::string_view path) const;

    /**
     * @brief Matches and dispatches one request.
     *
     * Returns 404 when nothing matches, 500 with a generic body when a
     * middleware throws, and 200 with an empty body when the chain produced no
     * response. Exceptions thrown by the handler, and NextCalledTwice,
     * propagate to the caller. A fresh store is created when @p store is null.
     */
    Async<Response> handle(Request req,
                           std::shared_ptr<const Store> env = nullptr,
                           std::shared_ptr<Store> store = nullptr) const;
};

} // namespace mizu

#endif
