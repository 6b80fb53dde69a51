#pragma once

#include <string>
#include "option.hpp"
#include "settings.hpp"

namespace config {

    // 生成 README 中的配置项表格（表头、分隔行、每项一行）
    std::string render_options_table(const ConfigOptions& options, bool code_span_cells = false);

    // 把 start_marker 结尾与其后第一个 end_marker 开头之间的内容替换为 replacement，
    // 其余字节保持不变。任一标记缺失时抛出 SectionNotFound。
    std::string replace_section(const std::string& document, const std::string& start_marker,
                                const std::string& end_marker, const std::string& replacement);

    // 读取整个文件、替换区段、写回。找不到标记时文件不会被改动。
    void update_readme_file(const ConfigOptions& options, const GeneratorSettings& settings,
                            const std::string& path);

}  // namespace config
