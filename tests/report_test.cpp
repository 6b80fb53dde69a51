#include "test_support.hpp"
#include <sstream>
#include "ui/report.hpp"

using namespace config;

namespace {

    GenerationReport finished_report() {
        GenerationReport report;
        report.stages = {
            {"load descriptors", "config.json", StageStatus::Done, ""},
            {"default config", "Config.zig", StageStatus::Done, ""},
            {"schema", "schema.json", StageStatus::Failed, "Unsupported type: 'f64'"},
            {"readme", "README.md", StageStatus::Pending, ""},
        };
        return report;
    }

}  // namespace

TEST(ReportTest, NoticesListOptionsWithSetupQuestion) {
    auto options = sample_options();
    options[1].setup_question = "Set b?";

    auto notices = ui::collect_notices(options);
    ASSERT_EQ(notices.size(), 2u);
    EXPECT_NE(notices[0].find("Options with a setup question: b."), std::string::npos) << notices[0];
    EXPECT_NE(notices[1].find("package.json"), std::string::npos);
}

TEST(ReportTest, NoticesWithoutSetupQuestions) {
    auto notices = ui::collect_notices(sample_options());
    ASSERT_EQ(notices.size(), 2u);
    EXPECT_EQ(notices[0].find("Options with a setup question"), std::string::npos);
}

TEST(ReportTest, PrintsStagesAndFailure) {
    std::ostringstream oss;
    ui::print_report(finished_report(), oss);
    const auto output = oss.str();

    EXPECT_NE(output.find("load descriptors"), std::string::npos);
    EXPECT_NE(output.find("schema.json"), std::string::npos);
    EXPECT_NE(output.find("FAILED"), std::string::npos);
    EXPECT_NE(output.find("skipped"), std::string::npos);
    EXPECT_NE(output.find("f64"), std::string::npos);
}
