#pragma once

#include <string>
#include "option.hpp"

namespace config {

    // 读取描述文件并解析为有序的配置项列表
    ConfigOptions load_descriptors(const std::string& path);

    // 解析描述文件内容：{"options": [{name, description, type, default, setup_question?}, ...]}
    // 结构不符、名称为空或重复时抛出 ParseError
    ConfigOptions parse_descriptors(const std::string& text);

}  // namespace config
