#include "log.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

bool init_logging(const Settings& settings, std::string& msg) {
  if (settings.log.empty()) {
    auto quiet = std::make_shared<spdlog::logger>("vtfeed", std::make_shared<spdlog::sinks::null_sink_mt>());
    spdlog::set_default_logger(quiet);
    spdlog::set_level(spdlog::level::off);
    return true;
  }
  try {
    auto logger = spdlog::basic_logger_mt("vtfeed", settings.log);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("can not open log file: ") + e.what();
    return false;
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::set_level(spdlog::level::from_str(settings.loglevel));
  spdlog::flush_on(spdlog::level::warn);
  return true;
}
