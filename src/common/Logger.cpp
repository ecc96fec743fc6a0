#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace porkbun::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  // from_str maps unknown names to off.
  const auto level = spdlog::level::from_str(sLevel);
  if (level == spdlog::level::off && sLevel != "off") {
    throw ConfigError("invalid_config", "Unknown log level '" + sLevel + "'");
  }
  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("porkbun");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace porkbun::common
