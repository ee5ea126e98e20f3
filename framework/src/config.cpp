#include <mizu/config.h>
#include <mizu/environment.h>

namespace mizu {

RouterConfig RouterConfig::from_env() {
    RouterConfig config;
    config.strict_patterns = env<bool>("MIZU_STRICT_PATTERNS", config.strict_patterns);
    config.not_found_body = env<std::string>("MIZU_NOT_FOUND_BODY", config.not_found_body);
    config.error_body = env<std::string>("MIZU_ERROR_BODY", config.error_body);
    return config;
}

} // namespace mizu
