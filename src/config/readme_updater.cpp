#include "readme_updater.hpp"
#include "errors.hpp"
#include "../utils/fs.hpp"
#include <sstream>

namespace config {

    namespace {

        std::string cell(const std::string& value, bool code_span) {
            return code_span ? "`" + value + "`" : value;
        }

    }  // namespace

    std::string render_options_table(const ConfigOptions& options, bool code_span_cells) {
        std::ostringstream oss;
        oss << "\n"
            << "| Option | Type | Default value | What it Does |\n"
            << "| --- | --- | --- | --- |\n";

        for (const auto& option : options) {
            oss << "| " << cell(trim(option.name), code_span_cells)
                << " | " << cell(trim(option.type), code_span_cells)
                << " | " << cell(trim(option.default_value), code_span_cells)
                << " | " << trim(option.description) << " |\n";
        }
        return oss.str();
    }

    std::string replace_section(const std::string& document, const std::string& start_marker,
                                const std::string& end_marker, const std::string& replacement) {
        const auto start_pos = document.find(start_marker);
        if (start_pos == std::string::npos) {
            throw SectionNotFound(start_marker);
        }
        const auto start = start_pos + start_marker.size();

        const auto end = document.find(end_marker, start);
        if (end == std::string::npos) {
            throw SectionNotFound(end_marker);
        }

        std::string result;
        result.reserve(start + replacement.size() + (document.size() - end));
        result.append(document, 0, start);
        result.append(replacement);
        result.append(document, end, std::string::npos);
        return result;
    }

    void update_readme_file(const ConfigOptions& options, const GeneratorSettings& settings,
                            const std::string& path) {
        const std::string readme = utils::filesystem::read_file(path);

        const std::string updated = replace_section(readme, settings.start_marker, settings.end_marker,
                                                    render_options_table(options, settings.code_span_cells));

        utils::filesystem::rewrite_file(path, updated);
    }

}  // namespace config
