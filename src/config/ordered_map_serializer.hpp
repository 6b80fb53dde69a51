#pragma once

#include <optional>
#include <ostream>
#include "option.hpp"

namespace config {

    struct Whitespace {
        // 当前对象所在的缩进层级
        int indent_level = 0;
        // 每层缩进的空格数
        int indent = 4;
        // 键和值之间是否加空格
        bool separator = true;

        void output_indent(std::ostream& out) const;
    };

    struct SerializeOptions {
        // 为空时输出紧凑格式（不换行）
        std::optional<Whitespace> whitespace;
    };

    // 按插入顺序序列化 json 对象，嵌套对象递归处理，缩进层级逐层加一。
    // 非对象的值按紧凑 json 输出。value 必须是对象。
    void serialize_object_map(const json& value, const SerializeOptions& options, std::ostream& out);

}  // namespace config
