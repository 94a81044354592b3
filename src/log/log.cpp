#include "a2a/log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

#include "a2a/core/config.hpp"

namespace a2a {

namespace {

// 每次启动时轮转日志文件
// 策略：a2a.log -> a2a.0.log -> ... -> a2a.{max_files-1}.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  // 如果当前日志文件不存在，无需轮转
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  auto dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto numbered = [&](size_t i) {
    return dir / (stem + "." + std::to_string(i) + ".log");
  };

  std::error_code ec;
  fs::remove(numbered(max_files - 1), ec);

  // 从后往前依次重命名
  for (size_t i = max_files - 1; i > 0; --i) {
    if (fs::exists(numbered(i - 1))) {
      fs::rename(numbered(i - 1), numbered(i), ec);
    }
  }

  fs::rename(current_log, numbered(0), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level, bool console) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "a2a.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true));
    if (console) {
      sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("a2a", sinks.begin(), sinks.end());

    // 未知级别字符串按 off 处理，这里退回 info
    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // 设置日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    logger->flush_on(spdlog::level::info);

    spdlog::drop("a2a");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== a2a started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

}  // namespace a2a
