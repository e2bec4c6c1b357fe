#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace holdem {
namespace service {

constexpr const char* kDefaultPort = "50410";
constexpr std::size_t kDefaultMaxTables = 1024;

struct ServerConfig {
    std::string port = kDefaultPort;
    std::size_t max_tables = kDefaultMaxTables;
    /// Set for replayable shuffles; each table derives its own seed from it.
    std::optional<std::uint64_t> shuffle_seed;

    std::string listen_address() const { return "0.0.0.0:" + port; }

    /**
     * Read PORT, HOLDEM_MAX_TABLES and HOLDEM_SHUFFLE_SEED.
     * Throws CommandRejectedError (InvalidArgument) for a malformed value.
     */
    static ServerConfig from_env();
};

} // namespace service
} // namespace holdem
