#ifndef MIZU_TRIE_H
#define MIZU_TRIE_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <mizu/context.h>

namespace mizu {

inline constexpr char param_marker = ':';
inline constexpr std::string_view wildcard_token = "*";

/**
 * @brief A bound middleware chain plus its terminal handler.
 *
 * The middleware list is a snapshot taken at registration time.
 */
struct Route {
    std::vector<Middleware> middleware;
    Handler handler;
};

struct RouteMatch {
    const Route* route = nullptr;  // Owned by the trie, valid while the router lives
    Params params;                 // {"id": "42"}, {"*": "a/b/c"}
};

/**
 * @brief One trie node: literal children plus optional parameter and wildcard children.
 *
 * All three kinds may coexist; which one wins is decided when matching
 * (literal, then parameter, then wildcard).
 */
struct TrieNode {
    std::unordered_map<std::string, std::unique_ptr<TrieNode>> children;
    std::unique_ptr<TrieNode> param_child;
    std::unique_ptr<TrieNode> wildcard_child;
    std::string param_name;  // Set on a parameter child only
    std::optional<Route> route;
};

/**
 * @brief Route tree for one HTTP method.
 *
 * Grows only while routes are registered; matching never mutates it, so a
 * fully built trie can be read from any number of requests at once.
 */
class Trie {
private:
    std::unique_ptr<TrieNode> root_;

public:
    Trie();

    /**
     * @brief Binds @p route at the node described by @p pattern.
     *
     * Re-registering a pattern replaces its route. In lenient mode an empty
     * parameter name is accepted, a conflicting parameter name renames the
     * existing capture (last registration wins) and segments after '*' are
     * dropped with a warning. Strict mode throws InvalidPattern for all three.
     */
    void insert(std::string_view pattern, Route route, bool strict = false);

    [[nodiscard]] std::optional<RouteMatch> match(const std::vector<std::string_view>& segments) const;

    const TrieNode& root() const { return *root_; }
};

} // namespace mizu

#endif
