#include "core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace Tally::Log {

void Logging::Init(const LoggingConfig& logging_config)
{
    std::lock_guard lock(mutex_);
    init_locked(logging_config);
}

void Logging::init_locked(const LoggingConfig& logging_config)
{
    logging_config_ = logging_config;
    sinks_.clear();

    // 日志输出到 stderr，stdout 留给程序本身的报告
    if (logging_config_.colored) {
        sinks_.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks_.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    }
    if (logging_config_.file_path) {
        sinks_.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*logging_config_.file_path, true));
    }
    for (auto& sink : sinks_) {
        sink->set_pattern(logging_config_.format);
    }

    for (auto& [_, logger] : loggers_) {
        logger->sinks() = sinks_;
        configure_locked(*logger);
    }
    initialized_ = true;
}

void Logging::Deinit()
{
    std::lock_guard lock(mutex_);
    loggers_.clear();
    sinks_.clear();
    initialized_ = false;
}

Logger Logging::CreateChannelLogger(const std::string& channel)
{
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        init_locked(LoggingConfig {});
    }

    if (auto it = loggers_.find(channel); it != loggers_.end()) {
        return it->second;
    }

    auto logger = std::make_shared<spdlog::logger>(channel, sinks_.begin(), sinks_.end());
    configure_locked(*logger);
    logger->flush_on(spdlog::level::err);

    loggers_.emplace(channel, logger);
    return logger;
}

void Logging::configure_locked(spdlog::logger& logger) const
{
    if (auto it = logging_config_.channels.find(logger.name()); it != logging_config_.channels.end()) {
        logger.set_level(it->second);
    } else {
        logger.set_level(logging_config_.verbosity);
    }
}

} // namespace Tally::Log
