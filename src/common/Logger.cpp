#include "common/Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace ddns::common {

namespace {
constexpr size_t kMaxLogFileBytes = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 5;
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
}  // namespace

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel, const std::optional<std::string>& oLogFile) {
  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(spdlog::level::from_str(sLevel));
    return;
  }

  std::vector<spdlog::sink_ptr> vSinks;
  vSinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (oLogFile.has_value()) {
    vSinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        *oLogFile, kMaxLogFileBytes, kMaxLogFiles));
  }

  auto spLogger = std::make_shared<spdlog::logger>("ddns", vSinks.begin(), vSinks.end());
  spLogger->set_pattern(kPattern);

  auto level = spdlog::level::from_str(sLevel);
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->info("Logger initialized at level '{}'{}", sLevel,
                 oLogFile ? " (file: " + *oLogFile + ")" : std::string{});
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace ddns::common
