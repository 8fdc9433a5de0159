#include <gtest/gtest.h>
#include "sanityml/report.hpp"

using namespace sanityml;

namespace {

Finding make(const std::string& path, const std::string& rule, Severity severity) {
    Finding f;
    f.artifact_path = path;
    f.rule_id = rule;
    f.severity = severity;
    f.rationale = "because";
    f.evidence = "evidence";
    return f;
}

ArtifactReport artifact(const std::string& path, ArtifactClass kind, std::vector<Finding> findings) {
    ArtifactReport a;
    a.path = path;
    a.kind = kind;
    a.state = ScanState::Reported;
    a.findings = std::move(findings);
    return a;
}

} // anonymous namespace

TEST(ReportTest, SummaryForIssues) {
    std::vector<ArtifactReport> artifacts;
    artifacts.push_back(artifact("train.py", ArtifactClass::Source,
                                 {make("train.py", "DENY_BUILTINS_EVAL", Severity::Critical)}));
    artifacts.push_back(artifact("util.py", ArtifactClass::Source, {}));
    artifacts.push_back(artifact("model.pt", ArtifactClass::Model, {}));

    ScanReport report = ScanReport::build(std::move(artifacts), 0.42);
    EXPECT_TRUE(report.any_issue());
    EXPECT_EQ(render_summary(report),
              "Issues detected.\n"
              "2 python files, 0 notebooks, 1 model, 0 requirements files scanned\n"
              "Findings: 1 critical, 0 warn, 0 info\n"
              "Completed in 0.4s\n");
    EXPECT_EQ(exit_status(report), 1);
}

TEST(ReportTest, SummaryForErrorsOnly) {
    std::vector<ArtifactReport> artifacts;
    artifacts.push_back(artifact("broken.pkl", ArtifactClass::Model,
                                 {make("broken.pkl", "PARSE_ERROR", Severity::Warn)}));

    ScanReport report = ScanReport::build(std::move(artifacts), 0.0);
    EXPECT_FALSE(report.any_issue());
    EXPECT_TRUE(report.any_error());
    EXPECT_EQ(render_summary(report).rfind("Scan completed with errors.\n", 0), 0u);
    EXPECT_EQ(exit_status(report), 1);
}

TEST(ReportTest, InfoOnlyPasses) {
    std::vector<ArtifactReport> artifacts;
    artifacts.push_back(artifact("w.safetensors", ArtifactClass::Model,
                                 {make("w.safetensors", "NO_PICKLE_STREAM", Severity::Info)}));
    artifacts.push_back(artifact("requirements.txt", ArtifactClass::Requirements, {}));

    ScanReport report = ScanReport::build(std::move(artifacts), 1.0);
    EXPECT_EQ(render_summary(report).rfind("All checks passed.\n", 0), 0u);
    EXPECT_NE(render_summary(report).find("1 requirements file scanned"), std::string::npos);
    EXPECT_EQ(exit_status(report), 0);
}

TEST(ReportTest, FindingsAreMergedInOrder) {
    std::vector<ArtifactReport> artifacts;
    artifacts.push_back(artifact("b.py", ArtifactClass::Source,
                                 {make("b.py", "IMPORT_SOCKET", Severity::Warn)}));
    artifacts.push_back(artifact("a.py", ArtifactClass::Source,
                                 {make("a.py", "IMPORT_PICKLE", Severity::Info),
                                  make("a.py", "DENY_OS_SYSTEM", Severity::Critical)}));

    ScanReport report = ScanReport::build(std::move(artifacts), 0.0);
    ASSERT_EQ(report.findings.size(), 3u);
    EXPECT_EQ(report.findings[0].rule_id, "DENY_OS_SYSTEM");
    EXPECT_EQ(report.findings[1].rule_id, "IMPORT_PICKLE");
    EXPECT_EQ(report.findings[2].rule_id, "IMPORT_SOCKET");
    EXPECT_EQ(report.finding_count(Severity::Warn), 1u);
}

TEST(ReportTest, TextSections) {
    Finding f = make("train.py", "DENY_OS_SYSTEM", Severity::Critical);
    f.locator = Locator::at_line("", 2, 1);
    f.evidence = "os.system('ls')";

    std::vector<ArtifactReport> artifacts;
    artifacts.push_back(artifact("train.py", ArtifactClass::Source, {f}));
    artifacts.push_back(artifact("model.pt", ArtifactClass::Model,
                                 {make("model.pt", "NO_PICKLE_STREAM", Severity::Info)}));

    ScanReport report = ScanReport::build(std::move(artifacts), 0.0);
    std::string text = render_text(report);

    EXPECT_NE(text.find("Python code\n"), std::string::npos);
    EXPECT_NE(text.find("| train.py\n"), std::string::npos);
    EXPECT_NE(text.find("|   [CRITICAL] DENY_OS_SYSTEM at line 2:1: because\n"), std::string::npos);
    EXPECT_NE(text.find("|       os.system('ls')\n"), std::string::npos);
    EXPECT_NE(text.find("[INFO] NO_PICKLE_STREAM"), std::string::npos);
    EXPECT_EQ(text.find("Notebooks"), std::string::npos);
    EXPECT_NE(text.find("Issues detected."), std::string::npos);

    std::string quiet = render_text(report, false);
    EXPECT_EQ(quiet.find("NO_PICKLE_STREAM"), std::string::npos);
    EXPECT_NE(quiet.find("Models\n----------------------------------------\n| Nothing to report\n"),
              std::string::npos);
}

TEST(ReportTest, JsonStructure) {
    Finding f = make("evil.pkl", "DENY_OS_SYSTEM", Severity::Critical);
    f.locator = Locator::at_offset("archive/data.pkl", 31);
    f.evidence = "os.system(\"id\")";

    ArtifactReport a = artifact("evil.pkl", ArtifactClass::Model, {f});
    a.streams = 1;
    a.aborted_in = ScanState::Parsed;

    std::vector<ArtifactReport> artifacts;
    artifacts.push_back(a);
    ScanReport report = ScanReport::build(std::move(artifacts), 0.25);

    std::string json = render_json(report);
    EXPECT_EQ(json.rfind("{\"summary\":{\"critical\":1,\"warn\":0,\"info\":0,", 0), 0u);
    EXPECT_NE(json.find("\"duration_seconds\":0.250"), std::string::npos);
    EXPECT_NE(json.find("\"exit_status\":1"), std::string::npos);
    EXPECT_NE(json.find("\"kind\":\"model\""), std::string::npos);
    EXPECT_NE(json.find("\"state\":\"reported\""), std::string::npos);
    EXPECT_NE(json.find("\"aborted_in\":\"parsed\""), std::string::npos);
    EXPECT_NE(json.find("\"streams\":1"), std::string::npos);
    EXPECT_NE(json.find("\"locator\":{\"entry\":\"archive/data.pkl\",\"offset\":31}"), std::string::npos);
    EXPECT_NE(json.find("\"evidence\":\"os.system(\\\"id\\\")\""), std::string::npos);
    EXPECT_EQ(json.back(), '}');
}

TEST(ReportTest, JsonLineLocator) {
    Finding f = make("a.py", "SHELL_TRUE", Severity::Warn);
    f.locator = Locator::at_line("cell 3", 2, 7);

    std::vector<ArtifactReport> artifacts;
    artifacts.push_back(artifact("a.py", ArtifactClass::Source, {f}));
    std::string json = render_json(ScanReport::build(std::move(artifacts), 0.0));

    EXPECT_NE(json.find("\"locator\":{\"entry\":\"cell 3\",\"line\":2,\"column\":7}"), std::string::npos);
    EXPECT_NE(json.find("\"aborted_in\":null"), std::string::npos);
}

TEST(ReportTest, EmptyRun) {
    ScanReport report = ScanReport::build({}, 0.0);
    EXPECT_EQ(exit_status(report), 0);
    EXPECT_NE(render_json(report).find("\"artifacts\":[]"), std::string::npos);
}

TEST(JsonEscapeTest, Escapes) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(json_escape("line\nnext\ttab\r"), "line\\nnext\\ttab\\r");
    EXPECT_EQ(json_escape(std::string("\x01\x1f\x7f", 3)), "\\u0001\\u001f\\u007f");
    EXPECT_EQ(json_escape(std::string("nul\0byte", 8)), "nul\\u0000byte");
}

TEST(JsonEscapeTest, Utf8) {
    EXPECT_EQ(json_escape("caf\xc3\xa9"), "caf\xc3\xa9");
    EXPECT_EQ(json_escape("\xf0\x9f\x98\x80"), "\xf0\x9f\x98\x80");

    // Lone continuation byte, truncated sequence, overlong encoding, surrogate
    EXPECT_EQ(json_escape("a\x80z"), "a\\ufffdz");
    EXPECT_EQ(json_escape("a\xc3"), "a\\ufffd");
    EXPECT_EQ(json_escape("\xc0\xaf"), "\\ufffd\\ufffd");
    EXPECT_EQ(json_escape("\xed\xa0\x80"), "\\ufffd\\ufffd\\ufffd");
}

TEST(ReportTest, ErrorRules) {
    EXPECT_TRUE(is_error_rule("PARSE_ERROR"));
    EXPECT_TRUE(is_error_rule("READ_ERROR"));
    EXPECT_TRUE(is_error_rule("NO_PICKLE_STREAM"));
    EXPECT_FALSE(is_error_rule("DENY_OS_SYSTEM"));
    EXPECT_FALSE(is_error_rule("parse_error"));
}
