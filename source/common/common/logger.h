#pragma once

#include <memory>
#include <string>
#include <vector>

#include "source/common/common/macros.h"

#include "absl/strings/string_view.h"
#include "fmt/format.h"
#include "spdlog/spdlog.h"

#if !ABSL_USES_STD_STRING_VIEW
// Where absl::string_view is its own type rather than std::string_view, format it like one.
template <>
struct fmt::formatter<absl::string_view> : fmt::formatter<fmt::string_view> {
  template <typename FormatContext>
  auto format(absl::string_view sv, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<fmt::string_view>::format(fmt::string_view(sv.data(), sv.size()), ctx);
  }
};
#endif

namespace KernelTls {
namespace Logger {

// clang-format off
#define ALL_LOGGER_IDS(FUNCTION)                                                                   \
  FUNCTION(config)                                                                                 \
  FUNCTION(connection)                                                                             \
  FUNCTION(ktls)                                                                                   \
  FUNCTION(misc)                                                                                   \
  FUNCTION(testing)
// clang-format on

enum class Id { ALL_LOGGER_IDS(GENERATE_ENUM) };

/**
 * Log levels in the order spdlog ranks them, with "error" spelled the usual way.
 */
struct Levels {
  enum Level {
    trace = spdlog::level::trace,
    debug = spdlog::level::debug,
    info = spdlog::level::info,
    warn = spdlog::level::warn,
    error = spdlog::level::err,
    critical = spdlog::level::critical,
    off = spdlog::level::off
  };
};

/**
 * Owns one spdlog logger per Id. All loggers share a single stderr sink.
 */
class Registry {
public:
  /**
   * @return the logger for the given id.
   */
  static spdlog::logger& getLog(Id id);

  /**
   * Sets the level of every registered logger.
   */
  static void setLogLevel(spdlog::level::level_enum level);

  /**
   * @return the name a logger is registered under, e.g. "connection".
   */
  static absl::string_view loggerName(Id id);

  /**
   * Parses a level name as accepted in configuration ("trace" ... "critical", "off").
   * @return false if the name is unknown.
   */
  static bool parseLogLevel(absl::string_view name, spdlog::level::level_enum& level);

private:
  static std::vector<std::shared_ptr<spdlog::logger>>& allLoggers();
};

/**
 * Mixin class that allows any class to perform logging with a logger of a particular ID.
 */
template <Id id> class Loggable {
protected:
  /**
   * Do not use this directly, use macros defined below.
   * @return spdlog::logger& the static log instance to use for class local logging.
   */
  static spdlog::logger& __log_do_not_use_read_comment() {
    static spdlog::logger& instance = Registry::getLog(id);
    return instance;
  }
};

} // namespace Logger

#define KTLS_SPDLOG_LEVEL(LEVEL)                                                                  \
  (static_cast<spdlog::level::level_enum>(::KernelTls::Logger::Levels::LEVEL))

#define KTLS_LOG_COMP_LEVEL(LOGGER, LEVEL) (KTLS_SPDLOG_LEVEL(LEVEL) >= (LOGGER).level())

/**
 * Base logging macros. It is expected that users will use the convenience macros below.
 */
#define KTLS_LOG_TO_LOGGER(LOGGER, LEVEL, ...)                                                    \
  do {                                                                                             \
    if (KTLS_LOG_COMP_LEVEL(LOGGER, LEVEL)) {                                                      \
      (LOGGER).log(::spdlog::source_loc{__FILE__, __LINE__, static_cast<const char*>(__func__)},   \
                   KTLS_SPDLOG_LEVEL(LEVEL), __VA_ARGS__);                                         \
    }                                                                                              \
  } while (0)

/**
 * Convenience macro to get logger.
 */
#define KTLS_LOGGER() __log_do_not_use_read_comment()

/**
 * Convenience macro to log to the class' logger.
 */
#define KTLS_LOG(LEVEL, ...) KTLS_LOG_TO_LOGGER(KTLS_LOGGER(), LEVEL, __VA_ARGS__)

/**
 * Convenience macro to log to the misc logger, for code outside a Loggable class.
 */
#define KTLS_LOG_MISC(LEVEL, ...)                                                                 \
  KTLS_LOG_TO_LOGGER(::KernelTls::Logger::Registry::getLog(::KernelTls::Logger::Id::misc), LEVEL, \
                     __VA_ARGS__)

/**
 * Convenience macro for connection logging, prefixed with the socket descriptor.
 */
#define KTLS_CONN_LOG(LEVEL, FORMAT, FD, ...)                                                     \
  KTLS_LOG_TO_LOGGER(KTLS_LOGGER(), LEVEL, "[fd={}] " FORMAT, (FD), ##__VA_ARGS__)

} // namespace KernelTls
