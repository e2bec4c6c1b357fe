#include "server_config.hpp"
#include "holdem/errors.hpp"
#include "holdem/random_source.hpp"
#include "holdem/validation.hpp"
#include <cstdlib>

namespace holdem {
namespace service {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

long long parse_number(const std::string& text, const std::string& name) {
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') {
        throw CommandRejectedError::invalid_argument(name + " must be a number: " + text);
    }
    return value;
}

} // anonymous namespace

ServerConfig ServerConfig::from_env() {
    ServerConfig config;

    if (const char* port = env_or_null("PORT")) {
        long long value = parse_number(port, "PORT");
        if (value <= 0 || value > 65535) {
            throw CommandRejectedError::invalid_argument("PORT is out of range");
        }
        config.port = port;
    }

    if (const char* max_tables = env_or_null("HOLDEM_MAX_TABLES")) {
        long long value = parse_number(max_tables, "HOLDEM_MAX_TABLES");
        validation::require_positive(value, "HOLDEM_MAX_TABLES");
        config.max_tables = static_cast<std::size_t>(value);
    }

    if (const char* seed = env_or_null("HOLDEM_SHUFFLE_SEED")) {
        config.shuffle_seed = seed_from_bytes(seed);
    }

    return config;
}

} // namespace service
} // namespace holdem
