#include <track_radar/logger.hpp>

#include <exception>
#include <utility>

namespace track_radar
{

Logger::Logger(LogSink sink)
: sink_(std::move(sink))
{
}

void Logger::log(const LogLevel level, const std::string & message) const noexcept
{
  if (!sink_) {
    return;
  }
  try {
    sink_(level, message);
  } catch (const std::exception &) {
    // Sink failures are dropped; there is nowhere left to report them.
  } catch (...) {
    // Same for anything a sink throws that is not a std::exception.
  }
}

const char * toString(const LogLevel level)
{
  switch (level) {
    case LogLevel::Verbose:
      return "VERBOSE";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

}  // namespace track_radar
