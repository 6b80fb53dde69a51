#pragma once

#include <ostream>
#include <string>
#include "option.hpp"
#include "settings.hpp"

namespace config {

    // 输出默认配置源码（Config.zig）：头部注释、每项的文档注释和字段声明、尾部注释。
    // 类型不做检查，原样输出。
    void write_config_source(const ConfigOptions& options, const GeneratorSettings& settings,
                             std::ostream& out);

    // 截断后写入 path。中途写入失败时文件保持截断状态，不做恢复。
    void generate_config_file(const ConfigOptions& options, const GeneratorSettings& settings,
                              const std::string& path);

}  // namespace config
