#ifndef A2A_LOG_H
#define A2A_LOG_H

#include <cstddef>
#include <string>

namespace a2a {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动时，上次的 <name>.log 重命名为 <name>.0.log
 * - 历史日志依次向后移动：<name>.0.log -> <name>.1.log -> ... -> <name>.<max_files-1>.log
 * - 最旧的日志被删除
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/a2a/log/a2a.log）
 * @param max_files 保留的历史日志文件数量
 * @param level 日志级别：trace, debug, info, warn, err, critical, off
 * @param console 是否同时输出到 stderr
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info", bool console = false);

}  // namespace a2a

#endif  // A2A_LOG_H
