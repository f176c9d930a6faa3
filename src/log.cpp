#include "readygate/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>

namespace readygate::log {

std::shared_ptr<spdlog::logger> make_logger(verbosity level) {
    return make_logger(level,
                       std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

std::shared_ptr<spdlog::logger> make_logger(verbosity level,
                                            spdlog::sink_ptr sink) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%-5l%$ %v");
    logger->set_level(to_level(level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

spdlog::level::level_enum to_level(verbosity level) noexcept {
    switch (level) {
    case verbosity::quiet:
        return spdlog::level::err;
    case verbosity::normal:
        return spdlog::level::info;
    case verbosity::debug:
        return spdlog::level::debug;
    }
    return spdlog::level::info;
}

} // namespace readygate::log
