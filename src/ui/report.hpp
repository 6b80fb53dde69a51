#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <ftxui/dom/elements.hpp>
#include "../config/pipeline.hpp"

namespace ui {

    // 生成完成后给维护者的提示
    std::vector<std::string> collect_notices(const config::ConfigOptions& options);

    // 各阶段状态表，失败时附带错误信息，成功时附带提示
    ftxui::Element render_report(const config::GenerationReport& report);

    // 非交互式渲染到 out（终端宽度）
    void print_report(const config::GenerationReport& report, std::ostream& out);

}  // namespace ui
