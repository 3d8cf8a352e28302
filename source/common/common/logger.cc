#include "source/common/common/logger.h"

#include <array>

#include "spdlog/sinks/stdout_sinks.h"

namespace KernelTls {
namespace Logger {

namespace {

constexpr std::array<absl::string_view, 5> LoggerNames = {ALL_LOGGER_IDS(GENERATE_STRING)};

} // namespace

std::vector<std::shared_ptr<spdlog::logger>>& Registry::allLoggers() {
  static auto* loggers = [] {
    auto* all = new std::vector<std::shared_ptr<spdlog::logger>>();
    auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    for (absl::string_view name : LoggerNames) {
      auto logger = std::make_shared<spdlog::logger>(std::string(name), sink);
      logger->set_pattern("[%Y-%m-%d %T.%e][%t][%l][%n] [%s:%#] %v");
      logger->set_level(spdlog::level::info);
      logger->flush_on(spdlog::level::critical);
      all->push_back(std::move(logger));
    }
    return all;
  }();
  return *loggers;
}

spdlog::logger& Registry::getLog(Id id) { return *allLoggers()[static_cast<size_t>(id)]; }

void Registry::setLogLevel(spdlog::level::level_enum level) {
  for (auto& logger : allLoggers()) {
    logger->set_level(level);
  }
}

absl::string_view Registry::loggerName(Id id) { return LoggerNames[static_cast<size_t>(id)]; }

bool Registry::parseLogLevel(absl::string_view name, spdlog::level::level_enum& level) {
  if (name == "error") {
    level = spdlog::level::err;
    return true;
  }
  const spdlog::level::level_enum parsed = spdlog::level::from_str(std::string(name));
  // from_str() maps unknown names to "off", so only trust it when the name really is "off".
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  level = parsed;
  return true;
}

} // namespace Logger
} // namespace KernelTls
