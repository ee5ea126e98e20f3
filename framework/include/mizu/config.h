#ifndef MIZU_CONFIG_H
#define MIZU_CONFIG_H

#include <string>

namespace mizu {

struct RouterConfig {
    bool strict_patterns = false;                       // Reject ambiguous patterns at registration
    std::string not_found_body = "Not Found";           // Body of the 404 response
    std::string error_body = "Internal Server Error";   // Body of the 500 response

    /**
     * @brief Reads MIZU_STRICT_PATTERNS, MIZU_NOT_FOUND_BODY and MIZU_ERROR_BODY,
     * falling back to the defaults above for unset variables.
     */
    static RouterConfig from_env();
};

} // namespace mizu

#endif
