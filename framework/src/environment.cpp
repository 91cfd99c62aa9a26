#include "meridian/environment.h"
#include <cstdlib>
#include <fstream>

namespace meridian {

    namespace {

        std::string trim(const std::string& str) {
            size_t first = str.find_first_not_of(" \t\r");
            if (std::string::npos == first) {
                return "";
            }
            size_t last = str.find_last_not_of(" \t\r");
            return str.substr(first, (last - first + 1));
        }

        // Double-quoted values understand \n, \t, \" and \\; single quotes are literal
        std::string unescape(const std::string& raw) {
            std::string out;
            out.reserve(raw.size());
            for (size_t i = 0; i < raw.size(); ++i) {
                if (raw[i] != '\\' || i + 1 == raw.size()) {
                    out.push_back(raw[i]);
                    continue;
                }
                switch (raw[++i]) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    default: out.push_back('\\'); out.push_back(raw[i]); break;
                }
            }
            return out;
        }

        std::string parse_value(const std::string& raw) {
            std::string value = trim(raw);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                return unescape(value.substr(1, value.size() - 2));
            }
            if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
                return value.substr(1, value.size() - 2);
            }
            // Unquoted: " #" starts a trailing comment
            size_t comment = value.find(" #");
            if (comment != std::string::npos) {
                value = trim(value.substr(0, comment));
            }
            return value;
        }

    } // namespace

    bool load_env(const std::string& path, bool overwrite) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            std::string clean_line = trim(line);
            if (clean_line.empty() || clean_line[0] == '#') {
                continue;
            }

            if (clean_line.starts_with("export ")) {
                clean_line = trim(clean_line.substr(7));
            }

            size_t delimiter_pos = clean_line.find('=');
            if (delimiter_pos == std::string::npos) {
                continue;
            }

            std::string key = trim(clean_line.substr(0, delimiter_pos));
            if (key.empty()) {
                continue;
            }

            std::string value = parse_value(clean_line.substr(delimiter_pos + 1));
            setenv(key.c_str(), value.c_str(), overwrite ? 1 : 0);
        }

        return true;
    }
}
