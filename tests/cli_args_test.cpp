#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "cli_args.hpp"
#include "safeprint/errors.hpp"

namespace fs = std::filesystem;

namespace {

// argv 수명 관리용
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args)
    {
        storage_.insert(storage_.begin(), "safe_print");
        for (auto& s : storage_) ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

class CliTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               (std::string("safeprint_cli_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::string write_file(const std::string& name, const std::string& content)
    {
        const fs::path p = dir_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    fs::path dir_;
};

} // namespace

TEST_F(CliTest, OptionsMapToPrintOptions)
{
    Argv a{"--label", "Worker", "--label-color", "blue", "--prefix", "JOB", "--color", "CYAN",
           "--highlight", "--secondary-highlight", "--file", "out.log", "--lines", "25",
           "--no-time", "--error", "--raw", "--dry-run", "input.txt"};
    AppConfig cfg;
    const CliArgs args = parse_args(a.argc(), a.argv(), cfg);

    const auto& o = cfg.print();
    EXPECT_EQ(o.child_process_label, "Worker");
    EXPECT_EQ(o.label_color, "blue");
    EXPECT_EQ(o.prefix, "JOB");
    EXPECT_EQ(o.text_color, "CYAN");
    EXPECT_TRUE(o.highlight);
    EXPECT_TRUE(o.secondary_highlight);
    EXPECT_EQ(o.file_path, "out.log");
    EXPECT_EQ(o.file_lines_limit, 25u);
    EXPECT_FALSE(o.show_time);
    EXPECT_TRUE(o.error);
    EXPECT_TRUE(args.raw);
    EXPECT_TRUE(args.dry_run);
    EXPECT_EQ(args.input_path, "input.txt");
}

TEST_F(CliTest, CommandLineOverridesConfigFile)
{
    const std::string cfg_path =
        write_file("cfg.json", R"({"print": {"prefix": "CFG", "child_process_label": "FromFile"}})");
    Argv a{"--prefix", "CLI", "--config", cfg_path};
    AppConfig cfg;
    const CliArgs args = parse_args(a.argc(), a.argv(), cfg);

    EXPECT_EQ(args.config_path, cfg_path);
    EXPECT_EQ(cfg.print().prefix, "CLI");
    EXPECT_EQ(cfg.print().child_process_label, "FromFile");
    EXPECT_TRUE(args.input_path.empty());
}

TEST_F(CliTest, ExplicitConfigMustLoad)
{
    Argv a{"--config", (dir_ / "missing.json").string()};
    AppConfig cfg;
    EXPECT_THROW(parse_args(a.argc(), a.argv(), cfg), safeprint::ConfigError);
}

TEST_F(CliTest, InvalidUsage)
{
    for (const auto& bad : {std::vector<std::string>{"--lines", "-1"},
                            std::vector<std::string>{"--lines", "10x"},
                            std::vector<std::string>{"--lines", "many"},
                            std::vector<std::string>{"--label"},
                            std::vector<std::string>{"--bogus"},
                            std::vector<std::string>{"one", "two"}}) {
        std::vector<std::string> full{"safe_print"};
        full.insert(full.end(), bad.begin(), bad.end());
        std::vector<char*> ptrs;
        for (auto& s : full) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);

        AppConfig cfg;
        EXPECT_THROW(parse_args(static_cast<int>(full.size()), ptrs.data(), cfg), safeprint::ConfigError)
            << bad.front();
    }
}

TEST_F(CliTest, DashMeansStdin)
{
    Argv a{"-"};
    AppConfig cfg;
    EXPECT_TRUE(parse_args(a.argc(), a.argv(), cfg).input_path.empty());
}

TEST_F(CliTest, ToValueParsesJsonOrFallsBackToBytes)
{
    const safeprint::Value obj = to_value(R"({"a": [1, "x"]})", false);
    ASSERT_EQ(obj.kind(), safeprint::Kind::Mapping);
    EXPECT_EQ(obj.as_map().key_at(0), "a");

    EXPECT_EQ(to_value("42\n", false), safeprint::Value(42));
    EXPECT_EQ(to_value("\"quoted\"", false), safeprint::Value("quoted"));

    const safeprint::Value text = to_value("hello world\n", false);
    ASSERT_EQ(text.kind(), safeprint::Kind::Bytes);
    EXPECT_EQ(text, safeprint::Value(safeprint::Bytes{'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd'}));

    // --raw 는 JSON 처럼 보여도 바이트열
    EXPECT_EQ(to_value("[1]\n", true), safeprint::Value(safeprint::Bytes{'[', '1', ']'}));
}

TEST_F(CliTest, ReadInputMissingFile)
{
    EXPECT_THROW(read_input((dir_ / "nope.txt").string()), safeprint::IoError);
    EXPECT_EQ(read_input(write_file("in.txt", "a\xFF" "b")), "a\xFF" "b");
}

TEST_F(CliTest, RunPrintsInputAndReturnsZero)
{
    const std::string input = write_file("in.json", R"({"a": 1})");
    const std::string log = (dir_ / "run.log").string();
    Argv a{"--no-time", "--file", log, input};

    testing::internal::CaptureStdout();
    const int rc = run_cli(a.argc(), a.argv());
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0);
    EXPECT_EQ(out, "{\n    \"a\": 1\n}\n");
    EXPECT_TRUE(fs::exists(log));
}

TEST_F(CliTest, DryRunSkipsLogFile)
{
    const std::string input = write_file("in.txt", "plain\n");
    const std::string log = (dir_ / "dry.log").string();
    Argv a{"--no-time", "--file", log, "--dry-run", input};

    testing::internal::CaptureStdout();
    const int rc = run_cli(a.argc(), a.argv());
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0);
    EXPECT_EQ(out, "plain\n");
    EXPECT_FALSE(fs::exists(log));
}

TEST_F(CliTest, RunUsageErrorReturnsTwo)
{
    Argv a{"--color", "PURPLE"};

    testing::internal::CaptureStderr();
    const int rc = run_cli(a.argc(), a.argv());
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 2);
    EXPECT_NE(err.find("unknown color name 'PURPLE'"), std::string::npos);
    EXPECT_NE(err.find("usage: safe_print"), std::string::npos);
}

TEST_F(CliTest, RunIoErrorIsReportedAndReturnsOne)
{
    Argv a{"--no-time", (dir_ / "absent.txt").string()};

    testing::internal::CaptureStdout();
    const int rc = run_cli(a.argc(), a.argv());
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(out.find("\x1b[31mLine #: "), std::string::npos);
    EXPECT_NE(out.find("cannot open input file"), std::string::npos);
}

TEST_F(CliTest, HelpReturnsZero)
{
    Argv a{"--help"};
    testing::internal::CaptureStdout();
    EXPECT_EQ(run_cli(a.argc(), a.argv()), 0);
    EXPECT_NE(testing::internal::GetCapturedStdout().find("LIGHTYELLOW_EX"), std::string::npos);
}
