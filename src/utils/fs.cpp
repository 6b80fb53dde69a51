#include "fs.hpp"
#include "../config/errors.hpp"
#include <iterator>
#include <system_error>

namespace utils::filesystem {

using config::IoError;

std::string read_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        throw IoError("Cannot open file for reading", path);
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw IoError("Failed to read file", path);
    }
    return content;
}

std::ofstream open_for_overwrite(const std::string& path) {
    std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw IoError("Cannot open file for writing", path);
    }
    return ofs;
}

void ensure_written(std::ostream& out, const std::string& path) {
    out.flush();
    if (!out) {
        throw IoError("Failed to write file", path);
    }
}

void rewrite_file(const std::string& path, const std::string& content) {
    {
        // 不带 trunc：先定位到开头再整体写回
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        if (!file.is_open()) {
            throw IoError("Cannot open file for writing", path);
        }
        file.seekp(0);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        ensure_written(file, path);
    }

    std::error_code ec;
    fs::resize_file(path, content.size(), ec);
    if (ec) {
        throw IoError("Failed to resize file (" + ec.message() + ")", path);
    }
}

}  // namespace utils::filesystem
