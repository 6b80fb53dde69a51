#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace config {

    using json = nlohmann::ordered_json;

    // 一个配置项描述
    struct ConfigOption {
        std::string name;
        // 用于文档注释、schema.json 和 README
        std::string description;
        // 内部类型记号，例如 "bool"、"usize"、"?[]const u8"
        std::string type;
        // 默认值表达式，原样写入
        std::string default_value;
        // 目前不被任何生成器使用
        std::optional<std::string> setup_question;
    };

    using ConfigOptions = std::vector<ConfigOption>;

    // 去掉首尾的 " \t\n\r"
    std::string trim(const std::string& s);

}  // namespace config
