#include <mizu/trie.h>
#include <mizu/exceptions.h>
#include <mizu/logger.h>
#include <mizu/util/path.h>

namespace mizu {

namespace {
    bool is_param(std::string_view segment) {
        return !segment.empty() && segment.front() == param_marker;
    }

    // Read-only walk used by strict mode, so a rejected pattern leaves the trie untouched.
    void validate(const TrieNode* node, std::string_view pattern, const std::vector<std::string_view>& segments) {
        for (size_t i = 0; i < segments.size(); ++i) {
            const std::string_view segment = segments[i];

            if (segment == wildcard_token) {
                if (i + 1 < segments.size()) {
                    throw InvalidPattern(std::string(pattern), "segments after '*' are not allowed");
                }
                return;
            }

            if (is_param(segment)) {
                const std::string_view name = segment.substr(1);
                if (name.empty()) {
                    throw InvalidPattern(std::string(pattern), "parameter name is empty");
                }
                if (node && node->param_child && node->param_child->param_name != name) {
                    throw InvalidPattern(std::string(pattern),
                                         "parameter ':" + std::string(name) + "' conflicts with ':" +
                                         node->param_child->param_name + "' registered at the same position");
                }
                node = node ? node->param_child.get() : nullptr;
                continue;
            }

            if (node) {
                auto it = node->children.find(std::string(segment));
                node = it == node->children.end() ? nullptr : it->second.get();
            }
        }
    }
}

Trie::Trie() : root_(std::make_unique<TrieNode>()) {}

void Trie::insert(std::string_view pattern, Route route, bool strict) {
    const auto segments = util::split_path(pattern);

    if (strict) {
        validate(root_.get(), pattern, segments);
    }

    TrieNode* node = root_.get();
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string_view segment = segments[i];

        if (segment == wildcard_token) {
            if (!node->wildcard_child) {
                node->wildcard_child = std::make_unique<TrieNode>();
            }
            node = node->wildcard_child.get();
            if (i + 1 < segments.size()) {
                Logger::instance().log(LogLevel::WARN,
                    "Route pattern '" + std::string(pattern) + "': segments after '*' are ignored");
            }
            break;
        }

        if (is_param(segment)) {
            std::string name(segment.substr(1));
            if (!node->param_child) {
                node->param_child = std::make_unique<TrieNode>();
                node->param_child->param_name = std::move(name);
            } else if (node->param_child->param_name != name) {
                Logger::instance().log(LogLevel::WARN,
                    "Route pattern '" + std::string(pattern) + "': parameter ':" +
                    node->param_child->param_name + "' renamed to ':" + name + "'");
                node->param_child->param_name = std::move(name);
            }
            node = node->param_child.get();
            continue;
        }

        auto& child = node->children[std::string(segment)];
        if (!child) {
            child = std::make_unique<TrieNode>();
        }
        node = child.get();
    }

    node->route = std::move(route);
}

std::optional<RouteMatch> Trie::match(const std::vector<std::string_view>& segments) const {
    const TrieNode* current = root_.get();
    Params params;

    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string_view segment = segments[i];

        auto it = current->children.find(std::string(segment));
        if (it != current->children.end()) {
            current = it->second.get();
        } else if (current->param_child) {
            params[current->param_child->param_name] = std::string(segment);
            current = current->param_child.get();
        } else if (current->wildcard_child) {
            params[std::string(wildcard_token)] = util::join_segments(segments, i);
            current = current->wildcard_child.get();
            break;
        } else {
            return std::nullopt;
        }
    }

    if (current->route) {
        return RouteMatch{&*current->route, std::move(params)};
    }

    // A wildcard also matches zero remaining segments ("/api" against "/api/*").
    if (current->wildcard_child && current->wildcard_child->route) {
        params[std::string(wildcard_token)] = "";
        return RouteMatch{&*current->wildcard_child->route, std::move(params)};
    }

    return std::nullopt;
}

} // namespace mizu
