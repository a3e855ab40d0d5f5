#pragma once

#include "types.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <string>

namespace parley {

namespace detail {

template<typename T>
Expected<void> read_optional_field(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return {};
    }
    try {
        out = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            std::string("Invalid value for '") + key + "'",
            std::string(e.what())
        });
    }
    return {};
}

template<typename T>
Expected<void> read_field(const nlohmann::json& j, const char* key, T& out) {
    std::optional<T> value;
    if (auto result = read_optional_field(j, key, value); !result) {
        return result;
    }
    if (value) {
        out = std::move(*value);
    }
    return {};
}

/**
 * @brief Read an integer field into T, rejecting values T cannot hold
 *
 * Floating-point values and anything outside T's range are InvalidConfig
 * instead of being truncated or wrapped.
 */
template<typename T>
Expected<void> read_integer_field(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return {};
    }

    const auto& value = j[key];
    if (!value.is_number_integer()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            std::string("'") + key + "' must be an integer",
            value.dump()
        });
    }

    bool in_range = false;
    if (value.is_number_unsigned()) {
        const auto v = value.get<uint64_t>();
        in_range = v <= static_cast<uint64_t>(std::numeric_limits<T>::max());
        if (in_range) {
            out = static_cast<T>(v);
        }
    } else {
        const auto v = value.get<int64_t>();
        in_range = v >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                   (v < 0 || static_cast<uint64_t>(v) <= static_cast<uint64_t>(std::numeric_limits<T>::max()));
        if (in_range) {
            out = static_cast<T>(v);
        }
    }

    if (!in_range) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            std::string("'") + key + "' is out of range",
            value.dump()
        });
    }
    return {};
}

template<typename T>
Expected<void> read_integer_field(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return {};
    }
    T value{};
    if (auto result = read_integer_field(j, key, value); !result) {
        return result;
    }
    out = value;
    return {};
}

inline Expected<ChatParameters> parse_parameters(const nlohmann::json& j) {
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "'default_parameters' must be an object"});
    }

    ChatParameters p;
    Expected<void> result;
    if (result = read_optional_field(j, "temperature", p.temperature); !result) return tl::unexpected(result.error());
    if (result = read_optional_field(j, "top_p", p.top_p); !result) return tl::unexpected(result.error());
    if (result = read_integer_field(j, "max_tokens", p.max_tokens); !result) return tl::unexpected(result.error());
    if (result = read_optional_field(j, "presence_penalty", p.presence_penalty); !result) return tl::unexpected(result.error());
    if (result = read_optional_field(j, "frequency_penalty", p.frequency_penalty); !result) return tl::unexpected(result.error());
    if (result = read_optional_field(j, "stop", p.stop); !result) return tl::unexpected(result.error());
    if (result = read_optional_field(j, "user", p.user); !result) return tl::unexpected(result.error());
    return p;
}

} // namespace detail

/**
 * @brief Build a Config from a JSON settings object
 *
 * Recognized keys: api_key, organization, default_model, message_limit,
 * message_expiration_seconds, throw_on_error, worker_threads,
 * request_queue_capacity, log_level ("debug", "info", "warn", "error",
 * "off") and default_parameters. Missing keys keep their defaults and
 * unknown keys are ignored.
 *
 * @return Expected<Config> Validated configuration, or InvalidConfig
 */
inline Expected<Config> parse_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Configuration must be a JSON object"});
    }

    Config config;
    Expected<void> result;

    if (result = detail::read_field(j, "api_key", config.api_key); !result) return tl::unexpected(result.error());
    if (result = detail::read_optional_field(j, "organization", config.organization); !result) return tl::unexpected(result.error());
    if (result = detail::read_field(j, "default_model", config.default_model); !result) return tl::unexpected(result.error());
    if (result = detail::read_integer_field(j, "message_limit", config.message_limit); !result) return tl::unexpected(result.error());
    if (result = detail::read_field(j, "throw_on_error", config.throw_on_error); !result) return tl::unexpected(result.error());
    if (result = detail::read_integer_field(j, "worker_threads", config.worker_threads); !result) return tl::unexpected(result.error());
    if (result = detail::read_integer_field(j, "request_queue_capacity", config.request_queue_capacity); !result) return tl::unexpected(result.error());

    if (j.contains("message_expiration_seconds") && !j["message_expiration_seconds"].is_null()) {
        int64_t expiration_seconds = 0;
        if (result = detail::read_integer_field(j, "message_expiration_seconds", expiration_seconds); !result) {
            return tl::unexpected(result.error());
        }
        config.message_expiration = std::chrono::seconds(expiration_seconds);
    }

    std::optional<std::string> level_name;
    if (result = detail::read_optional_field(j, "log_level", level_name); !result) {
        return tl::unexpected(result.error());
    }
    if (level_name) {
        auto level = log_level_from_string(*level_name);
        if (!level) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Unknown log level",
                *level_name
            });
        }
        config.log_level = *level;
    }

    if (j.contains("default_parameters") && !j["default_parameters"].is_null()) {
        auto parameters = detail::parse_parameters(j["default_parameters"]);
        if (!parameters) {
            return tl::unexpected(parameters.error());
        }
        config.default_parameters = std::move(*parameters);
    }

    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

/**
 * @brief Read and parse a JSON configuration file
 *
 * @param path Path to the file
 * @return Expected<Config> Validated configuration, or InvalidConfig when the
 *         file cannot be read or parsed
 */
inline Expected<Config> load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cannot open configuration file", path});
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            "Configuration file is not valid JSON",
            path + ": " + e.what()
        });
    }
    return parse_config(j);
}

} // namespace parley
