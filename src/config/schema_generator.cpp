#include "schema_generator.hpp"
#include "ordered_map_serializer.hpp"
#include "type_mapper.hpp"
#include "../utils/fs.hpp"

namespace config {

    json build_schema_properties(const ConfigOptions& options) {
        json properties = json::object();
        for (const auto& option : options) {
            json entry = json::object();
            entry["description"] = trim(option.description);
            entry["type"] = map_type(trim(option.type));
            entry["default"] = trim(option.default_value);
            properties[trim(option.name)] = std::move(entry);
        }
        return properties;
    }

    namespace {

        void write_schema_document(const json& properties, const GeneratorSettings& settings,
                                   std::ostream& out) {
            out << "{\n"
                << "    \"$schema\": " << json(settings.schema_uri).dump() << ",\n"
                << "    \"title\": " << json(settings.schema_title).dump() << ",\n"
                << "    \"description\": " << json(settings.schema_description).dump() << ",\n"
                << "    \"type\": \"object\",\n"
                << "    \"properties\": ";

            SerializeOptions serialize_options;
            serialize_options.whitespace = Whitespace{};
            serialize_options.whitespace->indent_level = 1;
            serialize_object_map(properties, serialize_options, out);

            out << "\n}\n";
        }

    }  // namespace

    void write_schema(const ConfigOptions& options, const GeneratorSettings& settings, std::ostream& out) {
        write_schema_document(build_schema_properties(options), settings, out);
    }

    void generate_schema_file(const ConfigOptions& options, const GeneratorSettings& settings,
                              const std::string& path) {
        const json properties = build_schema_properties(options);

        std::ofstream ofs = utils::filesystem::open_for_overwrite(path);
        write_schema_document(properties, settings, ofs);
        utils::filesystem::ensure_written(ofs, path);
    }

}  // namespace config
