#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <cstdlib>
#include <charconv>
#include <type_traits>
#include <meridian/exceptions.h>

namespace meridian {

    /**
     * @brief Loads KEY=VALUE lines from a dotenv file into the process environment.
     * Existing variables are kept unless @p overwrite is set.
     * @return false when the file cannot be opened.
     */
    bool load_env(const std::string& path = ".env", bool overwrite = false);

    namespace detail {
        template <typename T>
        T parse_env_number(const std::string& key, const std::string& s_val) {
            T out{};
            auto [ptr, ec] = std::from_chars(s_val.data(), s_val.data() + s_val.size(), out);
            if (ec != std::errc() || ptr != s_val.data() + s_val.size()) {
                throw ConfigError("Invalid integer in environment variable " + key + ": " + s_val);
            }
            return out;
        }
    }

    template <typename T = std::string>
    T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
        const char* val = std::getenv(key.c_str());

        if (val == nullptr || *val == '\0') {
            if (default_value.has_value()) {
                return default_value.value();
            }
            throw ConfigError("Missing environment variable: " + key);
        }

        std::string s_val = val;

        if constexpr (std::is_same_v<T, std::string>) {
            return s_val;
        }
        else if constexpr (std::is_same_v<T, bool>) {
            if (s_val == "true" || s_val == "1" || s_val == "yes" || s_val == "on") return true;
            if (s_val == "false" || s_val == "0" || s_val == "no" || s_val == "off") return false;
            throw ConfigError("Invalid boolean in environment variable " + key + ": " + s_val);
        }
        else if constexpr (std::is_same_v<T, int> || std::is_same_v<T, int64_t>) {
            return detail::parse_env_number<T>(key, s_val);
        }
        else {
            static_assert(sizeof(T) == 0, "Unsupported type for meridian::env");
        }
    }
}
