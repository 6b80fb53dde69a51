#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace config {

    // 按 schema 校验 json 文档结构，失败时抛出 ParseError，消息中列出全部错误
    // what 用于错误消息，说明被校验的是哪个文档
    void validate_document(const nlohmann::json& document, const nlohmann::json& schema,
                           const std::string& what);

}  // namespace config
