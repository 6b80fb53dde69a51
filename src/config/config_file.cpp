#include "config_file.hpp"
#include "../utils/fs.hpp"

namespace config {

    void write_config_source(const ConfigOptions& options, const GeneratorSettings& settings,
                             std::ostream& out) {
        out << "//! DO NOT EDIT\n"
            << "//! Configuration options for " << settings.project_name << ".\n"
            << "//! If you want to add a config option edit\n"
            << "//! " << settings.descriptor_hint << " and run `" << settings.regenerate_command << "`\n"
            << "//! GENERATED BY confgen\n";

        for (const auto& option : options) {
            out << "\n"
                << "/// " << trim(option.description) << "\n"
                << trim(option.name) << ": " << trim(option.type) << " = " << trim(option.default_value) << ",\n";
        }

        out << "\n"
            << "// DO NOT EDIT\n";
    }

    void generate_config_file(const ConfigOptions& options, const GeneratorSettings& settings,
                              const std::string& path) {
        std::ofstream ofs = utils::filesystem::open_for_overwrite(path);
        write_config_source(options, settings, ofs);
        utils::filesystem::ensure_written(ofs, path);
    }

}  // namespace config
