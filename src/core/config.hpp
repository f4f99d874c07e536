#pragma once

#include "core/money.hpp"
#include "core/status.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace apwatch {

/// Immutable configuration for apwatch
struct Config {
    /// Detection thresholds
    struct Detection {
        Money alert_min_amount = Money::from_units(500);
        double alert_sigma_threshold = 2.0;
        std::int64_t duplicate_day_window = 7;
        std::int64_t baseline_days = 90;
    };

    /// Logging configuration
    struct Logging {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
        bool async = true;
    };

    /// Multi-tenant runner configuration
    struct Runner {
        std::size_t worker_threads = 4;
    };

    Detection detection;
    Logging logging;
    Runner runner;

    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, ConfigError/ParseError on failure
    [[nodiscard]] static Result<Config> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Check value ranges
    [[nodiscard]] Result<Config> validate() const;
};

/// True for the level names spdlog understands ("trace" .. "off")
[[nodiscard]] bool is_valid_log_level(const std::string& level);

}  // namespace apwatch
