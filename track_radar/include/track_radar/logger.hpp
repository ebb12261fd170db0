#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace track_radar
{

enum class LogLevel : uint8_t
{
  Verbose,
  Info,
  Warning,
  Error
};

using LogSink = std::function<void (LogLevel, const std::string &)>;

/**
 * @class Logger
 * @brief Best-effort front for the host's log sink.
 *
 * A failing sink never propagates into the engine: both the fix path and the
 * watchdog timer call into it, and neither may die because logging did.
 */
class Logger
{
public:
  Logger() = default;
  explicit Logger(LogSink sink);

  void log(LogLevel level, const std::string & message) const noexcept;

  void verbose(const std::string & message) const noexcept { log(LogLevel::Verbose, message); }
  void info(const std::string & message) const noexcept { log(LogLevel::Info, message); }
  void warn(const std::string & message) const noexcept { log(LogLevel::Warning, message); }
  void error(const std::string & message) const noexcept { log(LogLevel::Error, message); }

private:
  LogSink sink_;
};

const char * toString(LogLevel level);

}  // namespace track_radar
