/**
 * @file Log.cpp
 * @brief Default ILogger implementation writing to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/core/Log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <mutex>
#include <string>

namespace spc::core {

namespace {

/// Writes "2026-10-19T08:15:02.125Z WARN  [VAULT] message" lines.
class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        static constexpr std::array<std::string_view, 5> kLevelNames = {
            "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
        };
        const auto stamp = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        const std::string line = std::format("{:%FT%TZ} {} [{}] {}\n",
            stamp, kLevelNames[static_cast<usize>(level)], tag, message);

        std::lock_guard<std::mutex> lock{_mutex};
        std::fputs(line.c_str(), stderr);
    }

private:
    std::mutex _mutex;
};

StderrLogger           gDefaultLogger;
std::atomic<ILogger *> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

} // anonymous namespace

void Log::setLogger(ILogger *logger)  { gActiveLogger.store(logger ? logger : &gDefaultLogger); }
void Log::setMinLevel(LogLevel level) { gMinLevel.store(level); }
LogLevel Log::minLevel()              { return gMinLevel.load(); }

static void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load(std::memory_order_relaxed))
        return;
    gActiveLogger.load()->write(level, tag, msg);
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace spc::core
