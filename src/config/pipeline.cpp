#include "pipeline.hpp"
#include "config_file.hpp"
#include "descriptor_loader.hpp"
#include "readme_updater.hpp"
#include "schema_generator.hpp"
#include <exception>
#include <functional>

namespace config {

    const StageResult* GenerationReport::failed_stage() const {
        for (const auto& stage : stages) {
            if (stage.status == StageStatus::Failed) {
                return &stage;
            }
        }
        return nullptr;
    }

    namespace {

        void run_stage(StageResult& result, const std::function<void()>& action) {
            try {
                action();
                result.status = StageStatus::Done;
            } catch (const std::exception& e) {
                result.status = StageStatus::Failed;
                result.message = e.what();
                throw;
            }
        }

    }  // namespace

    void run_pipeline(const GeneratorPaths& paths, const GeneratorSettings& settings, GenerationReport& report) {
        report.stages = {
            {"load descriptors", paths.descriptors},
            {"default config", paths.config_source},
            {"schema", paths.schema},
            {"readme", paths.readme},
        };
        report.options.clear();

        run_stage(report.stages[0], [&] { report.options = load_descriptors(paths.descriptors); });

        const ConfigOptions& options = report.options;
        run_stage(report.stages[1], [&] { generate_config_file(options, settings, paths.config_source); });
        run_stage(report.stages[2], [&] { generate_schema_file(options, settings, paths.schema); });
        run_stage(report.stages[3], [&] { update_readme_file(options, settings, paths.readme); });
    }

}  // namespace config
