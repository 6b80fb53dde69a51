#include "report.hpp"
#include <ftxui/screen/screen.hpp>

using namespace ftxui;

namespace ui {

    namespace {

        Element status_cell(config::StageStatus status) {
            switch (status) {
                case config::StageStatus::Done:
                    return text("done") | color(Color::Green);
                case config::StageStatus::Failed:
                    return text("FAILED") | bold | color(Color::Red);
                case config::StageStatus::Pending:
                    break;
            }
            return text("skipped") | dim;
        }

    }  // namespace

    std::vector<std::string> collect_notices(const config::ConfigOptions& options) {
        std::vector<std::string> notices;

        std::string with_question;
        for (const auto& option : options) {
            if (option.setup_question) {
                if (!with_question.empty()) with_question += ", ";
                with_question += config::trim(option.name);
            }
        }

        std::string wizard = "If you have added a new configuration option and it should be configurable "
                             "through the setup wizard, the wizard has to be edited by hand.";
        if (!with_question.empty()) {
            wizard += " Options with a setup question: " + with_question + ".";
        }
        notices.push_back(wizard);

        notices.push_back("Changing configuration options may also require editing editor extension "
                          "manifests (e.g. the package.json of the VS Code extension).");
        return notices;
    }

    Element render_report(const config::GenerationReport& report) {
        Elements rows;
        for (const auto& stage : report.stages) {
            rows.push_back(hbox({
                text(stage.stage) | size(WIDTH, EQUAL, 18),
                separator(),
                status_cell(stage.status) | size(WIDTH, EQUAL, 8),
                separator(),
                text(stage.artifact) | flex,
            }));
        }

        Elements sections = {
            window(text("confgen") | bold, vbox(rows)),
        };

        if (const auto* failed = report.failed_stage()) {
            sections.push_back(paragraph(failed->stage + " (" + failed->artifact + "): " + failed->message)
                               | color(Color::Red));
        } else {
            sections.push_back(text(std::to_string(report.options.size()) + " options generated"));
            for (const auto& notice : collect_notices(report.options)) {
                sections.push_back(paragraph(notice) | color(Color::Yellow));
            }
        }

        return vbox(sections);
    }

    void print_report(const config::GenerationReport& report, std::ostream& out) {
        auto document = render_report(report);
        auto screen = Screen::Create(Dimension::Full(), Dimension::Fit(document));
        Render(screen, document);
        out << screen.ToString() << std::endl;
    }

}  // namespace ui
