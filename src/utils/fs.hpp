#pragma once

#include <string>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace utils::filesystem {

    // 读取整个文件（二进制方式，保持字节不变）
    std::string read_file(const std::string& path);

    // 截断后打开用于写入，打不开时抛出 IoError
    std::ofstream open_for_overwrite(const std::string& path);

    // 流处于错误状态时抛出 IoError
    void ensure_written(std::ostream& out, const std::string& path);

    // 从文件开头写入全部内容，再按新长度截断（文件可能变短）
    void rewrite_file(const std::string& path, const std::string& content);

}  // namespace utils::filesystem
