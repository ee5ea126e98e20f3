#include <mizu/context.h>
#include <charconv>

namespace mizu {

std::string_view Context::param(const std::string& name) const {
    auto it = params.find(name);
    if (it != params.end()) {
        return it->second;
    }
    return {};
}

std::string Context::get_query(const std::string& key, const std::string& default_val) const {
    auto it = query.find(key);
    if (it != query.end()) {
        return it->second;
    }
    return default_val;
}

int Context::get_query_int(const std::string& key, int default_val) const {
    auto it = query.find(key);
    if (it == query.end()) {
        return default_val;
    }
    int value = 0;
    const auto& raw = it->second;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc() || ptr != raw.data() + raw.size()) {
        return default_val;
    }
    return value;
}

} // namespace mizu
