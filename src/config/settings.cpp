#include "settings.hpp"
#include "errors.hpp"
#include "validator.hpp"
#include "../utils/fs.hpp"

namespace config {

    namespace {

        const nlohmann::json& settings_schema() {
            static const nlohmann::json schema = nlohmann::json::parse(R"({
                "$schema": "http://json-schema.org/draft-07/schema#",
                "type": "object",
                "additionalProperties": false,
                "properties": {
                    "project_name": { "type": "string" },
                    "descriptor_hint": { "type": "string" },
                    "regenerate_command": { "type": "string" },
                    "schema_uri": { "type": "string" },
                    "schema_title": { "type": "string" },
                    "schema_description": { "type": "string" },
                    "start_marker": { "type": "string", "minLength": 1 },
                    "end_marker": { "type": "string", "minLength": 1 },
                    "code_span_cells": { "type": "boolean" }
                }
            })");
            return schema;
        }

        void override_string(const json& document, const char* key, std::string& target) {
            if (document.contains(key)) {
                target = document[key].get<std::string>();
            }
        }

    }  // namespace

    GeneratorSettings settings_from_json(const json& document) {
        // 校验器只接受 nlohmann::json，键顺序在这里无关紧要
        validate_document(nlohmann::json::parse(document.dump()), settings_schema(), "settings file");

        GeneratorSettings settings;
        override_string(document, "project_name", settings.project_name);
        override_string(document, "descriptor_hint", settings.descriptor_hint);
        override_string(document, "regenerate_command", settings.regenerate_command);
        override_string(document, "schema_uri", settings.schema_uri);
        override_string(document, "schema_title", settings.schema_title);
        override_string(document, "schema_description", settings.schema_description);
        override_string(document, "start_marker", settings.start_marker);
        override_string(document, "end_marker", settings.end_marker);
        if (document.contains("code_span_cells")) {
            settings.code_span_cells = document["code_span_cells"].get<bool>();
        }
        return settings;
    }

    GeneratorSettings load_settings(const std::string& path) {
        const std::string text = utils::filesystem::read_file(path);
        json document;
        try {
            document = json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError("Failed to parse settings JSON " + path + ": " + e.what());
        }
        return settings_from_json(document);
    }

}  // namespace config
