#pragma once

#include <ostream>
#include <string>
#include "option.hpp"
#include "settings.hpp"

namespace config {

    // 名称 -> {description, type, default}，保持描述文件中的顺序。
    // 任一类型不受支持时抛出 UnsupportedType，整个生成中止。
    json build_schema_properties(const ConfigOptions& options);

    void write_schema(const ConfigOptions& options, const GeneratorSettings& settings, std::ostream& out);

    // properties 在打开文件之前构建，类型错误时不会改动目标文件
    void generate_schema_file(const ConfigOptions& options, const GeneratorSettings& settings,
                              const std::string& path);

}  // namespace config
