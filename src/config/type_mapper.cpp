#include "type_mapper.hpp"
#include "errors.hpp"

namespace config {

    InternalType parse_internal_type(const std::string& token) {
        if (token == "?[]const u8")
            return InternalType::NullableString;
        if (token == "bool")
            return InternalType::Bool;
        if (token == "usize")
            return InternalType::Usize;
        throw UnsupportedType(token);
    }

    const char* schema_type_name(InternalType type) {
        switch (type) {
            case InternalType::NullableString:
                return "string";
            case InternalType::Bool:
                return "boolean";
            case InternalType::Usize:
                return "integer";
        }
        // 新增枚举值时编译器会对上面的 switch 给出警告
        throw UnsupportedType("<invalid InternalType>");
    }

    std::string map_type(const std::string& token) {
        return schema_type_name(parse_internal_type(token));
    }

}  // namespace config
