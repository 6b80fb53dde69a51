#include "descriptor_loader.hpp"
#include "errors.hpp"
#include "validator.hpp"
#include "../utils/fs.hpp"
#include <unordered_set>

namespace config {

    namespace {

        const nlohmann::json& descriptor_schema() {
            static const nlohmann::json schema = nlohmann::json::parse(R"({
                "$schema": "http://json-schema.org/draft-07/schema#",
                "type": "object",
                "additionalProperties": false,
                "required": ["options"],
                "properties": {
                    "options": {
                        "type": "array",
                        "items": {
                            "type": "object",
                            "additionalProperties": false,
                            "required": ["name", "description", "type", "default"],
                            "properties": {
                                "name": { "type": "string", "minLength": 1 },
                                "description": { "type": "string" },
                                "type": { "type": "string" },
                                "default": { "type": "string" },
                                "setup_question": { "type": ["string", "null"] }
                            }
                        }
                    }
                }
            })");
            return schema;
        }

    }  // namespace

    ConfigOptions parse_descriptors(const std::string& text) {
        // 数组保持顺序，这里不需要 ordered_json
        nlohmann::json document;
        try {
            document = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError("Failed to parse descriptor JSON: " + std::string(e.what()));
        }

        validate_document(document, descriptor_schema(), "descriptor document");

        ConfigOptions options;
        std::unordered_set<std::string> seen;
        const auto& records = document["options"];
        options.reserve(records.size());
        for (size_t i = 0; i < records.size(); ++i) {
            const auto& record = records[i];

            ConfigOption option;
            option.name = record["name"].get<std::string>();
            option.description = record["description"].get<std::string>();
            option.type = record["type"].get<std::string>();
            option.default_value = record["default"].get<std::string>();
            if (record.contains("setup_question") && !record["setup_question"].is_null()) {
                option.setup_question = record["setup_question"].get<std::string>();
            }

            const std::string name = trim(option.name);
            if (name.empty()) {
                throw ParseError("option #" + std::to_string(i) + " has a blank name");
            }
            if (!seen.insert(name).second) {
                throw ParseError("duplicate option name '" + name + "'");
            }

            options.push_back(std::move(option));
        }
        return options;
    }

    ConfigOptions load_descriptors(const std::string& path) {
        return parse_descriptors(utils::filesystem::read_file(path));
    }

}  // namespace config
