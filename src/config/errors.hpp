#pragma once

#include <stdexcept>
#include <string>

namespace config {

    // 描述文件 / 设置文件结构不符合要求
    class ParseError : public std::runtime_error {
    public:
        explicit ParseError(const std::string& message)
            : std::runtime_error("Parse error: " + message) {}
    };

    // 类型不在封闭词表内（仅 schema 生成时检查）
    class UnsupportedType : public std::runtime_error {
    public:
        explicit UnsupportedType(const std::string& token)
            : std::runtime_error("Unsupported type: '" + token + "'"), token_(token) {}

        const std::string& token() const { return token_; }

    private:
        std::string token_;
    };

    // 文档中找不到自动生成区段的标记
    class SectionNotFound : public std::runtime_error {
    public:
        explicit SectionNotFound(const std::string& marker)
            : std::runtime_error("Section marker not found: " + marker), marker_(marker) {}

        const std::string& marker() const { return marker_; }

    private:
        std::string marker_;
    };

    // 打开 / 读取 / 写入文件失败
    class IoError : public std::runtime_error {
    public:
        IoError(const std::string& message, const std::string& path)
            : std::runtime_error(message + ": " + path), path_(path) {}

        const std::string& path() const { return path_; }

    private:
        std::string path_;
    };

}  // namespace config
