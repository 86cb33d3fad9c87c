/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#include "rwn/core/Log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace rwn::core {

namespace {

class StderrLogger final : public ILogger
{
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr const char *kLevelNames[] = {
            "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
        };
        const auto idx = static_cast<unsigned>(level);
        std::lock_guard lock{mutex_};
        std::fprintf(
            stderr,
            "[%s][%.*s] %.*s\n",
            kLevelNames[idx],
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }

private:
    std::mutex mutex_;
};

StderrLogger          gDefaultLogger;
std::atomic<ILogger*> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel> gMinLevel{LogLevel::kInfo};

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load(std::memory_order_relaxed))
        return;
    gActiveLogger.load(std::memory_order_acquire)->write(level, tag, msg);
}

} // anonymous namespace

void Log::setLogger(ILogger *logger)
{
    gActiveLogger.store(logger ? logger : &gDefaultLogger, std::memory_order_release);
}

void Log::setMinLevel(LogLevel level) { gMinLevel.store(level, std::memory_order_relaxed); }

LogLevel Log::minLevel() { return gMinLevel.load(std::memory_order_relaxed); }

bool Log::setMinLevel(std::string_view name)
{
    static constexpr struct { std::string_view name; LogLevel level; } kNames[] = {
        {"debug", LogLevel::kDebug},
        {"info",  LogLevel::kInfo},
        {"warn",  LogLevel::kWarn},
        {"error", LogLevel::kError},
        {"fatal", LogLevel::kFatal},
    };
    for (const auto &entry : kNames)
    {
        if (entry.name == name)
        {
            setMinLevel(entry.level);
            return true;
        }
    }
    return false;
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace rwn::core
