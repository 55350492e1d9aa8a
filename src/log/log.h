#ifndef KUBERDE_LOG_H
#define KUBERDE_LOG_H

#include <memory>
#include <string>

#include "core/config.hpp"

namespace spdlog {
class logger;
}

namespace kuberde {

/**
 * 初始化日志系统
 *
 * - 始终输出到 stderr（带颜色），容器环境下由运行时收集
 * - 配置了 file 时额外写入按大小轮转的日志文件（max_size / max_files）
 * - 级别：trace / debug / info / warn / err / critical / off
 *
 * @param name   logger 名称，同时出现在每行日志中（kuberde-server / kuberde-agent / kuberde-operator）
 * @param config 日志配置
 */
void init_log(const std::string& name, const LogConfig& config = {});

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace kuberde

#endif  // KUBERDE_LOG_H
