//
// Created by aowei on 2026 10月 17.
//

#ifndef MUNCH_LOG_HPP
#define MUNCH_LOG_HPP

#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace munch::log {
    // 全局 "munch" 日志器，首次调用时创建，默认级别为 warn
    std::shared_ptr<spdlog::logger> logger();
    void set_level(spdlog::level::level_enum level);
    // 解析 "trace"/"debug"/"info"/"warn"/"error"/"off"，未知名称抛出 std::invalid_argument
    spdlog::level::level_enum parse_level(std::string_view name);
}

#endif //MUNCH_LOG_HPP
