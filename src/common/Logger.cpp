#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace netprov::common {

namespace {
std::mutex gMtxInit;
}  // namespace

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  std::lock_guard<std::mutex> lock(gMtxInit);
  const auto level = spdlog::level::from_str(sLevel);

  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("netprov");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  {
    std::lock_guard<std::mutex> lock(gMtxInit);
    if (_bInitialized) {
      return spdlog::default_logger();
    }
  }
  init("info");
  return spdlog::default_logger();
}

}  // namespace netprov::common
