#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Tally::Log {

using Logger = std::shared_ptr<spdlog::logger>;

struct LoggingConfig {
    // Level applied to channels without an explicit entry in `channels`
    spdlog::level::level_enum verbosity { spdlog::level::warn };
    std::unordered_map<std::string, spdlog::level::level_enum> channels;
    std::string format { "[%H:%M:%S.%e] [%n] [%^%l%$] %v" };
    bool colored { true };
    // Additionally write every channel to this file when set
    std::optional<std::string> file_path;
};

/**
 * @brief Process wide registry of spdlog channel loggers
 *
 * Channels requested before Init() use the default config (warn level,
 * colored console), so library code can log unconditionally.
 */
class Logging {
public:
    static Logging& get()
    {
        static Logging instance;
        return instance;
    }

    /**
     * @brief (Re)configure sinks and levels; existing channel loggers are updated in place
     */
    void Init(const LoggingConfig& logging_config);

    /**
     * @brief Drop all channel loggers
     */
    void Deinit();

    /**
     * @brief Creates (or returns existing) channel logger
     */
    Logger CreateChannelLogger(const std::string& channel);

private:
    Logging() = default;
    ~Logging() = default;
    Logging(const Logging&) = delete;
    Logging& operator=(const Logging&) = delete;

    void init_locked(const LoggingConfig& logging_config);
    void configure_locked(spdlog::logger& logger) const;

    std::mutex mutex_;
    LoggingConfig logging_config_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, Logger> loggers_;
    bool initialized_ { false };
};

inline Logger channel(const std::string& name)
{
    return Logging::get().CreateChannelLogger(name);
}

} // namespace Tally::Log
