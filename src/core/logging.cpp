#include "core/logging.hpp"
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace apwatch {

void setup_logging(const Config::Logging& config) {
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(8192, 1);
        logger = std::make_shared<spdlog::async_logger>(
            "apwatch",
            stdout_sink,
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::block
        );
    } else {
        logger = std::make_shared<spdlog::logger>("apwatch", stdout_sink);
    }

    logger->set_pattern(config.pattern);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.level));
}

}  // namespace apwatch
