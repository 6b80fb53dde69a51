#pragma once

#include <string>
#include <vector>
#include "option.hpp"
#include "settings.hpp"

namespace config {

    struct GeneratorPaths {
        std::string descriptors;
        std::string config_source;
        std::string schema;
        std::string readme;
    };

    enum class StageStatus {
        Pending,
        Done,
        Failed,
    };

    struct StageResult {
        std::string stage;
        std::string artifact;
        StageStatus status = StageStatus::Pending;
        std::string message;
    };

    struct GenerationReport {
        std::vector<StageResult> stages;
        // 成功加载的配置项（加载失败时为空）
        ConfigOptions options;

        const StageResult* failed_stage() const;
    };

    // 依次执行：加载描述文件、生成 Config.zig、生成 schema.json、更新 README。
    // 遇到第一个错误时在 report 中记录失败的阶段，然后原样重新抛出异常；
    // 已经写出的产物不会回滚，之后的阶段保持 Pending。
    void run_pipeline(const GeneratorPaths& paths, const GeneratorSettings& settings, GenerationReport& report);

}  // namespace config
