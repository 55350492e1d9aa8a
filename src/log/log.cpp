#include "log/log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

namespace kuberde {

namespace {

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

}  // namespace

void init_log(const std::string& name, const LogConfig& config) {
  try {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
      namespace fs = std::filesystem;

      // 确保日志目录存在
      std::error_code ec;
      auto dir = fs::path(config.file).parent_path();
      if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
          std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        }
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.file, config.max_size, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(parse_level(config.level));

    // 格式：[时间] [级别] [logger] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%t] %v");

    logger->flush_on(spdlog::level::warn);

    spdlog::drop(name);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== {} started (level: {}{}) ===", name, config.level, config.file.empty() ? "" : ", log: " + config.file);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace kuberde
