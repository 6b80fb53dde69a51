#include "ordered_map_serializer.hpp"
#include <stdexcept>
#include <string>

namespace config {

    void Whitespace::output_indent(std::ostream& out) const {
        out << '\n' << std::string(static_cast<size_t>(indent_level * indent), ' ');
    }

    void serialize_object_map(const json& value, const SerializeOptions& options, std::ostream& out) {
        if (!value.is_object()) {
            throw std::invalid_argument("serialize_object_map expects an object, got " +
                                        std::string(value.type_name()));
        }

        SerializeOptions child_options = options;
        if (child_options.whitespace) {
            child_options.whitespace->indent_level += 1;
        }

        out << '{';
        bool field_output = false;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!field_output) {
                field_output = true;
            } else {
                out << ',';
            }
            if (child_options.whitespace) {
                child_options.whitespace->output_indent(out);
            }

            out << json(it.key()).dump() << ':';
            if (child_options.whitespace && child_options.whitespace->separator) {
                out << ' ';
            }

            const json& child = it.value();
            if (child.is_object()) {
                serialize_object_map(child, child_options, out);
            } else {
                out << child.dump();
            }
        }
        if (field_output && options.whitespace) {
            options.whitespace->output_indent(out);
        }
        out << '}';
    }

}  // namespace config
