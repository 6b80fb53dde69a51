#pragma once

#include <string>
#include "option.hpp"

namespace config {

    struct GeneratorSettings {
        // 默认配置文件头部注释
        std::string project_name = "zls";
        std::string descriptor_hint = "src/config_gen/config.json";
        std::string regenerate_command = "zig build gen";

        // schema.json 元数据
        std::string schema_uri = "http://json-schema.org/schema";
        std::string schema_title = "ZLS Config";
        std::string schema_description = "Configuration file for the zig language server (ZLS)";

        // README 中自动生成区段的起止标记
        std::string start_marker = "<!-- DO NOT EDIT | THIS SECTION IS AUTO-GENERATED | DO NOT EDIT -->";
        std::string end_marker = "<!-- DO NOT EDIT -->";

        // 表格中的名称/类型/默认值是否用反引号包裹
        bool code_span_cells = false;
    };

    // 从 json 设置文件加载，文件中的键覆盖默认值
    GeneratorSettings load_settings(const std::string& path);

    GeneratorSettings settings_from_json(const json& document);

}  // namespace config
