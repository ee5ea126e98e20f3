#include <mizu/util/path.h>
#include <mizu/util/string.h>

namespace mizu::util {

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;

    size_t start = 0;
    while (start < path.size()) {
        if (path[start] == '/') {
            start++;
            continue;
        }
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }

        segments.push_back(path.substr(start, end - start));
        start = end;
    }

    return segments;
}

std::string join_segments(const std::vector<std::string_view>& segments, size_t from) {
    std::string joined;
    for (size_t i = from; i < segments.size(); ++i) {
        if (i > from) joined += '/';
        joined += segments[i];
    }
    return joined;
}

std::string strip_prefix(std::string_view path, std::string_view prefix) {
    if (!path.starts_with(prefix)) {
        return "/";
    }
    std::string_view rest = path.substr(prefix.size());
    if (rest.starts_with('/')) {
        return std::string(rest);
    }
    // A prefix ending in '/' consumes the separator; put it back.
    return "/" + std::string(rest);
}

std::unordered_map<std::string, std::string> parse_query(std::string_view query) {
    std::unordered_map<std::string, std::string> params;

    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp_pos = query.find('&', pos);
        if (amp_pos == std::string_view::npos) amp_pos = query.size();

        std::string_view pair = query.substr(pos, amp_pos - pos);
        if (!pair.empty()) {
            size_t eq_pos = pair.find('=');
            if (eq_pos != std::string_view::npos) {
                params[url_decode(pair.substr(0, eq_pos))] = url_decode(pair.substr(eq_pos + 1));
            } else {
                params[url_decode(pair)] = "";
            }
        }

        pos = amp_pos + 1;
    }

    return params;
}

} // namespace mizu::util
