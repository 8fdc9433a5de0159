#include <gtest/gtest.h>
#include "sanityml/deps/advisory.hpp"
#include "sanityml/deps/requirements.hpp"

#include <filesystem>
#include <fstream>

using namespace sanityml;
using namespace sanityml::deps;
namespace fs = std::filesystem;

// ============================================================================
// Requirements files
// ============================================================================

TEST(RequirementsTest, ParseFile) {
    const std::string text =
        "# comment\n"
        "numpy==1.21.0\n"
        "torch >= 1.10, <2.0  # inline\n"
        "Requests[security, socks]==2.25.1 ; python_version < \"3.8\"\n"
        "-r other.txt\n"
        "--index-url https://example.com/simple\n"
        "https://example.com/pkg.tar.gz\n"
        "./local/path\n"
        "pillow @ https://example.com/pillow.whl\n"
        "transformers\n";

    auto reqs = parse_requirements(text);
    ASSERT_EQ(reqs.size(), 5u);

    EXPECT_EQ(reqs[0].name, "numpy");
    EXPECT_EQ(reqs[0].line, 2u);
    ASSERT_TRUE(reqs[0].pinned_version().has_value());
    EXPECT_EQ(*reqs[0].pinned_version(), "1.21.0");

    EXPECT_EQ(reqs[1].name, "torch");
    EXPECT_EQ(reqs[1].line, 3u);
    EXPECT_EQ(specs_to_string(reqs[1].specs), ">=1.10,<2.0");
    EXPECT_FALSE(reqs[1].pinned_version().has_value());

    EXPECT_EQ(reqs[2].name, "requests");
    EXPECT_EQ(reqs[2].declared_name, "Requests");
    EXPECT_EQ(reqs[2].extras, (std::vector<std::string>{"security", "socks"}));
    EXPECT_EQ(reqs[2].marker, "python_version < \"3.8\"");
    EXPECT_EQ(*reqs[2].pinned_version(), "2.25.1");

    EXPECT_EQ(reqs[3].name, "pillow");
    EXPECT_TRUE(reqs[3].direct_reference);
    EXPECT_EQ(reqs[3].line, 9u);

    EXPECT_EQ(reqs[4].name, "transformers");
    EXPECT_TRUE(reqs[4].specs.empty());
    EXPECT_EQ(reqs[4].line, 10u);
}

TEST(RequirementsTest, LineContinuation) {
    auto reqs = parse_requirements("numpy \\\n  ==1.0\nscipy\r\n");

    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].name, "numpy");
    EXPECT_EQ(reqs[0].line, 1u);
    EXPECT_EQ(*reqs[0].pinned_version(), "1.0");
    EXPECT_EQ(reqs[1].name, "scipy");
    EXPECT_EQ(reqs[1].line, 3u);
}

TEST(RequirementsTest, MalformedLinesAreSkipped) {
    auto reqs = parse_requirements("numpy>=>1\n[broken\nok-pkg~=1.2\n");
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].name, "ok-pkg");
}

TEST(RequirementsTest, NormalizeName) {
    EXPECT_EQ(normalize_name("Foo__Bar.baz"), "foo-bar-baz");
    EXPECT_EQ(normalize_name("A-_-B"), "a-b");
    EXPECT_EQ(normalize_name("PyYAML"), "pyyaml");
}

TEST(RequirementsTest, PinnedVersion) {
    Requirement req;
    req.specs = parse_specifiers("===1.0-custom");
    EXPECT_EQ(*req.pinned_version(), "1.0-custom");

    req.specs = parse_specifiers("==1.2.*");
    EXPECT_FALSE(req.pinned_version().has_value());

    req.specs = parse_specifiers("==1.0,!=1.1");
    EXPECT_FALSE(req.pinned_version().has_value());
}

// ============================================================================
// Specifiers
// ============================================================================

TEST(SpecifierTest, ParseErrors) {
    EXPECT_THROW(parse_specifiers(">=1.0,,<2"), std::invalid_argument);
    EXPECT_THROW(parse_specifiers("1.0"), std::invalid_argument);
    EXPECT_THROW(parse_specifiers(">=1.*"), std::invalid_argument);
    EXPECT_THROW(parse_specifiers("==1.*.2"), std::invalid_argument);
    EXPECT_THROW(parse_specifiers("=="), std::invalid_argument);
    EXPECT_TRUE(parse_specifiers("  ").empty());
}

TEST(SpecifierTest, Matching) {
    auto wildcard = parse_specifiers("==1.2.*");
    EXPECT_TRUE(satisfies("1.2.5", wildcard));
    EXPECT_TRUE(satisfies("1.2", wildcard));
    EXPECT_FALSE(satisfies("1.3.0", wildcard));
    EXPECT_TRUE(satisfies("1.3", parse_specifiers("!=1.2.*")));

    auto compatible = parse_specifiers("~=1.4.2");
    EXPECT_TRUE(satisfies("1.4.5", compatible));
    EXPECT_FALSE(satisfies("1.5.0", compatible));
    EXPECT_FALSE(satisfies("1.4.1", compatible));
    EXPECT_TRUE(satisfies("2.9", parse_specifiers("~=2.2")));
    EXPECT_FALSE(satisfies("3.0", parse_specifiers("~=2.2")));

    EXPECT_TRUE(satisfies("1.0", parse_specifiers("===1.0")));
    EXPECT_FALSE(satisfies("1.0.0", parse_specifiers("===1.0")));
    EXPECT_TRUE(satisfies("1.0.0", parse_specifiers("==1.0")));

    auto range = parse_specifiers(">=2.0, <2.3");
    EXPECT_TRUE(satisfies("2.2.9", range));
    EXPECT_FALSE(satisfies("2.3", range));
    EXPECT_FALSE(satisfies("1.9", range));
    EXPECT_TRUE(satisfies("anything", {}));
}

// ============================================================================
// Versions
// ============================================================================

TEST(VersionTest, Parse) {
    auto rc = parse_version("1.0rc1");
    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(rc->release, (std::vector<int64_t>{1, 0}));
    EXPECT_EQ(rc->pre_phase, 2);
    EXPECT_EQ(rc->pre_number, 1);
    EXPECT_TRUE(rc->is_prerelease());

    auto post = parse_version("1.0.post2");
    ASSERT_TRUE(post.has_value());
    ASSERT_TRUE(post->post.has_value());
    EXPECT_EQ(*post->post, 2);
    EXPECT_FALSE(post->is_prerelease());

    auto dev = parse_version("1.0.dev3");
    ASSERT_TRUE(dev.has_value());
    ASSERT_TRUE(dev->dev.has_value());
    EXPECT_EQ(*dev->dev, 3);

    EXPECT_EQ(parse_version("2!1.0")->epoch, 2);
    EXPECT_TRUE(parse_version("v1.0").has_value());
    EXPECT_TRUE(parse_version("1.0+local.7").has_value());
    EXPECT_FALSE(parse_version("not-a-version").has_value());
    EXPECT_FALSE(parse_version("").has_value());
}

TEST(VersionTest, Ordering) {
    const std::vector<std::string> ordered = {
        "1.0.dev1", "1.0a1", "1.0b1", "1.0rc1", "1.0", "1.0.post1", "1.1", "2!0.1",
    };
    for (size_t i = 0; i + 1 < ordered.size(); ++i) {
        EXPECT_LT(compare_versions(ordered[i], ordered[i + 1]), 0)
            << ordered[i] << " vs " << ordered[i + 1];
        EXPECT_GT(compare_versions(ordered[i + 1], ordered[i]), 0);
    }
    EXPECT_EQ(compare_versions("1.0", "1.0.0"), 0);
    EXPECT_LT(compare_versions("1.9", "1.10"), 0);
    EXPECT_LT(compare_versions("abc", "abd"), 0);
}

// ============================================================================
// Advisories
// ============================================================================

namespace {

const char* const ADVISORIES =
    "# package | id | affected | summary\n"
    "torch | PYSEC-2022-1 | <1.13.1 | torch.load runs arbitrary code\n"
    "Torch_Foo | GHSA-1 | >=2.0,<2.3; ==3.0 | Bad things\n"
    "pyyaml | CVE-2020-1747 | * | full_load runs arbitrary code\n";

int failing_line(const std::string& text) {
    try {
        AdvisoryDatabase::parse(text);
    } catch (const AdvisoryLoadError& e) {
        return e.line();
    }
    return 0;
}

} // anonymous namespace

TEST(AdvisoryTest, Parse) {
    auto db = AdvisoryDatabase::parse(ADVISORIES, "advisories.txt");
    EXPECT_EQ(db->size(), 3u);
    EXPECT_EQ(db->name(), "advisories.txt");

    auto found = db->query(parse_requirements("torch-foo==2.1\n"));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, "GHSA-1");
    EXPECT_EQ(found[0].package, "torch-foo");
    EXPECT_EQ(found[0].affected_text(), ">=2.0,<2.3; ==3.0");
    EXPECT_TRUE(found[0].affects("2.1"));
    EXPECT_TRUE(found[0].affects("3.0"));
    EXPECT_FALSE(found[0].affects("2.5"));

    auto all = db->query(parse_requirements("pyyaml\npyyaml==5.1\n"));
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].all_versions);
    EXPECT_EQ(all[0].affected_text(), "*");

    EXPECT_TRUE(db->query(parse_requirements("numpy\n")).empty());
}

TEST(AdvisoryTest, MalformedLines) {
    EXPECT_EQ(failing_line("torch | ID-1 | <1 | ok\na | b | c\n"), 2);
    EXPECT_EQ(failing_line("pkg | bad id! | <1 | s\n"), 1);
    EXPECT_EQ(failing_line("pkg | ID-1 | nonsense | s\n"), 1);
    EXPECT_EQ(failing_line("pkg | ID-1 | <1 |\n"), 1);
    EXPECT_EQ(failing_line(" | ID-1 | <1 | s\n"), 1);
}

class AdvisoryFileTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "sanityml_advisory_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }
};

TEST_F(AdvisoryFileTest, LoadFile) {
    fs::path path = temp_dir / "advisories.txt";
    std::ofstream(path) << ADVISORIES;

    auto db = AdvisoryDatabase::load_file(path.string());
    EXPECT_EQ(db->size(), 3u);
    EXPECT_THROW(AdvisoryDatabase::load_file((temp_dir / "absent.txt").string()), AdvisoryLoadError);
}

// ============================================================================
// DependencyScanner
// ============================================================================

TEST(DependencyScannerTest, PinnedAndUnpinned) {
    auto db = AdvisoryDatabase::parse(ADVISORIES);
    DependencyScanner scanner(db.get());

    auto reqs = parse_requirements("torch==1.12.0\npyyaml>=5.0\nnumpy==1.0\n");
    auto findings = scanner.scan(reqs, "requirements.txt");

    ASSERT_EQ(findings.size(), 2u);

    EXPECT_EQ(findings[0].rule_id, "PYSEC-2022-1");
    EXPECT_EQ(findings[0].severity, Severity::Warn);
    EXPECT_EQ(findings[0].artifact_path, "requirements.txt");
    EXPECT_EQ(findings[0].locator.to_string(), "line 1:1");
    EXPECT_EQ(findings[0].evidence, "torch==1.12.0 is within affected range <1.13.1");
    EXPECT_EQ(findings[0].rationale, "torch.load runs arbitrary code");

    EXPECT_EQ(findings[1].rule_id, "CVE-2020-1747");
    EXPECT_EQ(findings[1].severity, Severity::Info);
    EXPECT_EQ(findings[1].locator.line, 2u);
    EXPECT_EQ(findings[1].evidence, "pyyaml >=5.0 is not pinned; affected range *");
}

TEST(DependencyScannerTest, FixedVersionIsSilent) {
    auto db = AdvisoryDatabase::parse(ADVISORIES);
    DependencyScanner scanner(db.get());

    EXPECT_TRUE(scanner.scan(parse_requirements("torch==1.13.1\n"), "r.txt").empty());
}

TEST(DependencyScannerTest, NoSource) {
    DependencyScanner scanner(nullptr);
    EXPECT_TRUE(scanner.scan(parse_requirements("torch==1.0\n"), "r.txt").empty());
}
