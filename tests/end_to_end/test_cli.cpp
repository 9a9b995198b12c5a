/**
 * @file test_cli.cpp
 * @brief End-to-end runs of the stackless binary over the sample fixture
 */

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sys/wait.h>

namespace stackless::end_to_end::test {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kStacklessBinary = STACKLESS_TEST_CLI_BIN;

constexpr std::string_view kBumpAnnotated = "pub fun M::bump(r: &mut u64, n: u64): u64 {\n"
                                            "    var $t2: u64\n"
                                            "    // lifetime: begin $t2\n"
                                            "    $t2 := 1\n"
                                            "    // live vars: n, $t2\n"
                                            "    $t2 := n + $t2\n"
                                            "    write_ref(&r, $t2)\n"
                                            "    spec_block 0 { assert n > 0 }\n"
                                            "    // lifetime: end $t2\n"
                                            "    return $t2\n"
                                            "}\n";

constexpr std::string_view kBumpPlain = "pub fun M::bump(r: &mut u64, n: u64): u64 {\n"
                                        "    var $t2: u64\n"
                                        "    $t2 := 1\n"
                                        "    $t2 := n + $t2\n"
                                        "    write_ref(&r, $t2)\n"
                                        "    spec_block 0 { assert n > 0 }\n"
                                        "    return $t2\n"
                                        "}\n";

constexpr std::string_view kBorrowMut = "fun M::borrow_mut(r: &mut u64): &mut u64 {\n"
                                        "    return &r\n"
                                        "}\n";

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

[[nodiscard]] std::string quote_arg(std::string_view value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return std::format("\"{}\"", escaped);
}

[[nodiscard]] std::string read_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

[[nodiscard]] std::string sample_fixture()
{
    return (fs::path(STACKLESS_FIXTURE_DIR) / "sample.json").string();
}

struct CliRun
{
    int exit_code = -1;
    std::string out;
    std::string err;
};

/// Runs the binary with `args`, capturing both streams through files in `dir`.
[[nodiscard]] CliRun run_stackless(const TempDir& dir, const std::vector<std::string>& args)
{
    std::string command = quote_arg(kStacklessBinary);
    for (const auto& arg : args) {
        command += ' ';
        command += quote_arg(arg);
    }
    const fs::path out_path = dir.path() / "stdout.txt";
    const fs::path err_path = dir.path() / "stderr.txt";
    command += std::format(" > {} 2> {}", quote_arg(out_path.string()), quote_arg(err_path.string()));

    const int status = std::system(command.c_str());
    CliRun run;
    if (status != -1 && WIFEXITED(status)) {
        run.exit_code = WEXITSTATUS(status);
    }
    run.out = read_file(out_path);
    run.err = read_file(err_path);
    return run;
}

class CliTest : public ::testing::Test
{
protected:
    CliTest()
        : m_dir(std::format("stackless_cli_{}",
                            ::testing::UnitTest::GetInstance()->current_test_info()->name()))
    {}

    TempDir m_dir;
};

}  // namespace

TEST_F(CliTest, RenderTextListsAllTargetsInIdOrder)
{
    const auto run = run_stackless(m_dir, {"render", "--fixture", sample_fixture()});
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, std::format("{}\n{}", kBumpAnnotated, kBorrowMut));
    EXPECT_TRUE(run.err.empty()) << run.err;
}

TEST_F(CliTest, NoAnnotationsDropsCommentLines)
{
    const auto run = run_stackless(
        m_dir, {"render", "--fixture", sample_fixture(), "--function", "M::bump", "--no-annotations"});
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, kBumpPlain);
}

TEST_F(CliTest, FunctionSelectsOneTarget)
{
    const auto run =
        run_stackless(m_dir, {"render", "--function", "M::borrow_mut", "--fixture", sample_fixture()});
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_EQ(run.out, kBorrowMut);
}

TEST_F(CliTest, JsonFormatDumpsEverySnapshot)
{
    const auto run =
        run_stackless(m_dir, {"render", "--fixture", sample_fixture(), "--format", "json"});
    ASSERT_EQ(run.exit_code, 0) << run.err;

    const auto dumps = nlohmann::json::parse(run.out);
    ASSERT_TRUE(dumps.is_array());
    ASSERT_EQ(dumps.size(), 2U);
    EXPECT_EQ(dumps[0].at("schema_version"), "dump.v1");
    EXPECT_EQ(dumps[0].at("function"), "M::bump");
    EXPECT_EQ(dumps[0].at("generation"), 1);
    EXPECT_EQ(dumps[1].at("function"), "M::borrow_mut");
    EXPECT_EQ(dumps[1].at("ref_params"),
              nlohmann::json::parse(R"([{"param": "r", "return": 0}])"));
    EXPECT_EQ(run.out.back(), '\n');
}

TEST_F(CliTest, OutputWritesFileInsteadOfStdout)
{
    const fs::path output = m_dir.path() / "render.txt";
    const auto run = run_stackless(
        m_dir, {"render", "--fixture", sample_fixture(), "-o", output.string(), "--verbose"});
    ASSERT_EQ(run.exit_code, 0) << run.err;
    EXPECT_TRUE(run.out.empty());
    EXPECT_EQ(read_file(output), std::format("{}\n{}", kBumpAnnotated, kBorrowMut));
    EXPECT_NE(run.err.find("[render] M::bump (generation 1)"), std::string::npos) << run.err;
    EXPECT_NE(run.err.find("[render] 2 function(s)"), std::string::npos) << run.err;
}

TEST_F(CliTest, MissingOptionValueFails)
{
    const auto run = run_stackless(m_dir, {"render", "--fixture"});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_TRUE(run.out.empty());
    EXPECT_NE(run.err.find("Error: Missing value for option: --fixture"), std::string::npos)
        << run.err;
}

TEST_F(CliTest, MissingFixtureOptionFails)
{
    const auto run = run_stackless(m_dir, {"render", "--format", "json"});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_NE(run.err.find("Error: --fixture is required"), std::string::npos) << run.err;
}

TEST_F(CliTest, UnknownOptionFails)
{
    const auto run = run_stackless(m_dir, {"render", "--fixture", sample_fixture(), "--bogus"});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_TRUE(run.out.empty());
    EXPECT_NE(run.err.find("Error: Unknown option: --bogus"), std::string::npos) << run.err;
}

TEST_F(CliTest, InvalidFormatFails)
{
    const auto run =
        run_stackless(m_dir, {"render", "--fixture", sample_fixture(), "--format", "yaml"});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_NE(run.err.find("Error: Invalid --format value: yaml"), std::string::npos) << run.err;
}

TEST_F(CliTest, FunctionWithoutTargetFails)
{
    const auto run =
        run_stackless(m_dir, {"render", "--fixture", sample_fixture(), "--function", "M::native_len"});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_TRUE(run.out.empty());
    EXPECT_NE(run.err.find("Error: No target for function: M::native_len"), std::string::npos)
        << run.err;
}

TEST_F(CliTest, MissingFixtureFileFails)
{
    const auto missing = (m_dir.path() / "absent.json").string();
    const auto run = run_stackless(m_dir, {"render", "--fixture", missing});
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_NE(run.err.find("Failed to open fixture file"), std::string::npos) << run.err;
}

TEST_F(CliTest, VersionNamesFormats)
{
    const auto run = run_stackless(m_dir, {"version"});
    ASSERT_EQ(run.exit_code, 0);
    EXPECT_TRUE(run.out.starts_with("stackless ")) << run.out;
    EXPECT_NE(run.out.find("fixture.v1"), std::string::npos);
    EXPECT_NE(run.out.find("dump.v1"), std::string::npos);
}

}  // namespace stackless::end_to_end::test
