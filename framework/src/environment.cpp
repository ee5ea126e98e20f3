#include "mizu/environment.h"
#include <fstream>
#include <string_view>

namespace mizu {

    namespace {
        std::string_view trim(std::string_view str) {
            const size_t first = str.find_first_not_of(" \t\r");
            if (first == std::string_view::npos) {
                return {};
            }
            const size_t last = str.find_last_not_of(" \t\r");
            return str.substr(first, last - first + 1);
        }

        std::string unquote(std::string_view value) {
            if (value.size() >= 2 &&
               ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\''))) {
                return std::string(value.substr(1, value.size() - 2));
            }
            return std::string(value);
        }
    }

    bool load_env(const std::string& path, bool overwrite) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            std::string_view entry = trim(line);

            if (entry.empty() || entry.front() == '#') {
                continue;
            }

            // Shell-style files prefix assignments with "export".
            if (entry.starts_with("export ")) {
                entry = trim(entry.substr(7));
            }

            const size_t delimiter_pos = entry.find('=');
            if (delimiter_pos == std::string_view::npos) {
                continue;
            }

            const std::string key(trim(entry.substr(0, delimiter_pos)));
            if (key.empty()) {
                continue;
            }
            const std::string value = unquote(trim(entry.substr(delimiter_pos + 1)));

            setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0);
        }

        return true;
    }
}
