#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "config/pipeline.hpp"
#include "config/settings.hpp"
#include "ui/report.hpp"

namespace {

    void print_usage(std::ostream& out) {
        out << "usage: confgen [--settings <file>] [--quiet] "
               "<descriptors.json> <Config.zig> <schema.json> <README.md>\n";
    }

}  // namespace

int main(int argc, char* argv[]) {
    std::string settings_path;
    bool quiet = false;
    std::vector<std::string> positional;

    // 1. 解析参数
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return EXIT_SUCCESS;
        } else if (arg == "--quiet" || arg == "-q") {
            quiet = true;
        } else if (arg == "--settings") {
            if (i + 1 >= argc) {
                std::cerr << "--settings requires a path" << std::endl;
                print_usage(std::cerr);
                return EXIT_FAILURE;
            }
            settings_path = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 4) {
        print_usage(std::cerr);
        return EXIT_FAILURE;
    }

    // 2. 加载设置
    config::GeneratorSettings settings;
    if (!settings_path.empty()) {
        try {
            settings = config::load_settings(settings_path);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load settings " << settings_path << ": " << e.what() << std::endl;
            return EXIT_FAILURE;
        }
    }

    config::GeneratorPaths paths{positional[0], positional[1], positional[2], positional[3]};

    // 3. 生成，第一个错误即终止
    config::GenerationReport report;
    try {
        config::run_pipeline(paths, settings, report);
    } catch (const std::exception& e) {
        ui::print_report(report, std::cerr);
        const auto* failed = report.failed_stage();
        std::cerr << "Generation failed";
        if (failed) {
            std::cerr << " at stage '" << failed->stage << "' (" << failed->artifact << ")";
        }
        std::cerr << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (!quiet) {
        ui::print_report(report, std::cerr);
    }
    return EXIT_SUCCESS;
}
