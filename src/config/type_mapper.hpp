#pragma once

#include <string>

namespace config {

    // 封闭的内部类型词表
    enum class InternalType {
        NullableString,   // ?[]const u8
        Bool,             // bool
        Usize,            // usize
    };

    // 解析内部类型记号，不在词表内时抛出 UnsupportedType
    InternalType parse_internal_type(const std::string& token);

    // 内部类型 -> schema 类型
    const char* schema_type_name(InternalType type);

    // 以上两步的组合：map_type("bool") == "boolean"
    std::string map_type(const std::string& token);

}  // namespace config
