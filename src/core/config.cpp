#include "core/config.hpp"
#include <array>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace apwatch {

using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer within [min_val, max_val]
std::optional<std::int64_t> get_env_int(const char* name, std::int64_t min_val,
                                        std::int64_t max_val) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        long long result = std::stoll(*value);
        if (result < min_val || result > max_val) {
            std::cerr << "Warning: " << name << " value " << result
                      << " out of range [" << min_val << ", " << max_val
                      << "], ignoring" << std::endl;
            return std::nullopt;
        }
        return static_cast<std::int64_t>(result);
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid integer value for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Get environment variable as double
std::optional<double> get_env_double(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        return std::stod(*value);
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid number for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Get environment variable as a money amount
std::optional<Money> get_env_money(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        Money amount = Money::parse(*value);
        if (amount.is_negative()) {
            std::cerr << "Warning: " << name << " must be non-negative, ignoring" << std::endl;
            return std::nullopt;
        }
        return amount;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid amount for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    if (auto v = get_env_money("APWATCH_ALERT_MIN_AMOUNT")) {
        config.detection.alert_min_amount = *v;
    }
    if (auto v = get_env_double("APWATCH_ALERT_SIGMA_THRESHOLD")) {
        if (*v > 0.0) {
            config.detection.alert_sigma_threshold = *v;
        }
    }
    // Day windows: up to ten years
    if (auto v = get_env_int("APWATCH_DUPLICATE_DAY_WINDOW", 0, 3650)) {
        config.detection.duplicate_day_window = *v;
    }
    if (auto v = get_env_int("APWATCH_BASELINE_DAYS", 1, 3650)) {
        config.detection.baseline_days = *v;
    }

    if (auto v = get_env("APWATCH_LOG_LEVEL")) {
        if (is_valid_log_level(*v)) {
            config.logging.level = *v;
        } else {
            std::cerr << "Warning: Unknown log level " << *v << ", ignoring" << std::endl;
        }
    }
    if (auto v = get_env_int("APWATCH_WORKER_THREADS", 1, 256)) {
        config.runner.worker_threads = static_cast<std::size_t>(*v);
    }
}

/// Amounts may be written as JSON numbers or decimal strings
Money read_money(const json& j) {
    if (j.is_string()) {
        return Money::parse(j.get<std::string>());
    }
    return Money::from_double(j.get<double>());
}

}  // namespace

bool is_valid_log_level(const std::string& level) {
    for (const char* name : kLogLevels) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

Result<Config> Config::validate() const {
    if (detection.alert_min_amount.is_negative()) {
        return fail<Config>(ErrorCode::ConfigError, "alert_min_amount must be non-negative");
    }
    if (!(detection.alert_sigma_threshold > 0.0)) {
        return fail<Config>(ErrorCode::ConfigError, "alert_sigma_threshold must be positive");
    }
    if (detection.duplicate_day_window < 0) {
        return fail<Config>(ErrorCode::ConfigError, "duplicate_day_window must be non-negative");
    }
    if (detection.baseline_days < 1) {
        return fail<Config>(ErrorCode::ConfigError, "baseline_days must be at least 1");
    }
    if (!is_valid_log_level(logging.level)) {
        return fail<Config>(ErrorCode::ConfigError, "Unknown log level: " + logging.level);
    }
    if (runner.worker_threads == 0) {
        return fail<Config>(ErrorCode::ConfigError, "worker_threads must be at least 1");
    }
    return Result<Config>::Ok(*this);
}

Result<Config> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail<Config>(ErrorCode::ConfigError, "Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return fail<Config>(ErrorCode::ParseError, "Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("detection")) {
            const auto& det = j["detection"];
            if (det.contains("alert_min_amount")) {
                config.detection.alert_min_amount = read_money(det["alert_min_amount"]);
            }
            if (det.contains("alert_sigma_threshold")) {
                config.detection.alert_sigma_threshold = det["alert_sigma_threshold"].get<double>();
            }
            if (det.contains("duplicate_day_window")) {
                config.detection.duplicate_day_window = det["duplicate_day_window"].get<std::int64_t>();
            }
            if (det.contains("baseline_days")) {
                config.detection.baseline_days = det["baseline_days"].get<std::int64_t>();
            }
        }

        if (j.contains("logging")) {
            const auto& log = j["logging"];
            if (log.contains("level")) {
                config.logging.level = log["level"].get<std::string>();
            }
            if (log.contains("pattern")) {
                config.logging.pattern = log["pattern"].get<std::string>();
            }
            if (log.contains("async")) {
                config.logging.async = log["async"].get<bool>();
            }
        }

        if (j.contains("runner")) {
            const auto& run = j["runner"];
            if (run.contains("worker_threads")) {
                // Signed read so a negative value is rejected instead of wrapping
                auto threads = run["worker_threads"].get<std::int64_t>();
                if (threads < 1) {
                    return fail<Config>(ErrorCode::ConfigError, "worker_threads must be at least 1");
                }
                config.runner.worker_threads = static_cast<std::size_t>(threads);
            }
        }
    } catch (const json::exception& e) {
        return fail<Config>(ErrorCode::ParseError, "Error reading config field: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return fail<Config>(ErrorCode::ParseError, "Error reading config amount: " + std::string(e.what()));
    } catch (const std::overflow_error& e) {
        return fail<Config>(ErrorCode::ParseError, "Error reading config amount: " + std::string(e.what()));
    }

    return config.validate();
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error().message
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    apply_env_overrides(config);

    return config;
}

}  // namespace apwatch
