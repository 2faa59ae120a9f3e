//
// Created by aowei on 2026 10月 17.
//

#include <stdexcept>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <munch/log.hpp>

namespace munch::log {
    std::shared_ptr<spdlog::logger> logger() {
        // 函数内静态变量，初始化线程安全
        static const std::shared_ptr<spdlog::logger> instance = [] {
            auto created = spdlog::get("munch");
            if (!created) {
                created = spdlog::stderr_color_mt("munch");
                created->set_level(spdlog::level::warn);
            }
            return created;
        }();
        return instance;
    }

    void set_level(const spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

    spdlog::level::level_enum parse_level(const std::string_view name) {
        const auto level = spdlog::level::from_str(std::string(name));
        // from_str 对未知名称返回 off，需要区分真正的 "off"
        if (level == spdlog::level::off && name != "off") {
            throw std::invalid_argument("Unknown log level '" + std::string(name) + "'");
        }
        return level;
    }
}
