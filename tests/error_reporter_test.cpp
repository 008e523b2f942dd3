#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

#include "safeprint/error_reporter.hpp"
#include "safeprint/errors.hpp"
#include "safeprint/printer.hpp"

using namespace safeprint;
namespace fs = std::filesystem;

namespace {

int divide(int a, int b)
{
    if (b == 0) {
        SP_THROW(ErrorCode::kInvalidArgument, "division by zero");
    }
    return a / b;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TEST(ErrorReporter, TracedErrorCarriesThrowSite)
{
    try {
        divide(1, 0);
        FAIL() << "expected TracedError";
    } catch (const TracedError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInvalidArgument);
        EXPECT_EQ(e.message(), "division by zero");
        EXPECT_EQ(e.function(), "divide");
        EXPECT_GT(e.line(), 0);
        EXPECT_NE(e.file().find("error_reporter_test.cpp"), std::string::npos);
    }
}

TEST(ErrorReporter, DescribeTracedError)
{
    try {
        divide(1, 0);
    } catch (const std::exception& e) {
        const std::string text = describe_active_error(e);
        EXPECT_EQ(text.rfind("Line #: ", 0), 0u);
        EXPECT_NE(text.find(" causes the error. Error message: division by zero\nTraceback:\n"), std::string::npos);
        EXPECT_NE(text.find(", in divide\n"), std::string::npos);
    }
}

TEST(ErrorReporter, DescribeForeignException)
{
    try {
        throw std::out_of_range("index 9");
    } catch (const std::exception& e) {
        const std::string text = describe_active_error(e);
        EXPECT_EQ(text.rfind("Line #: ? causes the error. Error message: index 9\nTraceback:\n", 0), 0u);
        EXPECT_NE(text.find("std::out_of_range"), std::string::npos);
    }
}

TEST(ErrorReporter, NoActiveException)
{
    const std::runtime_error unrelated("not thrown");
    EXPECT_EQ(describe_active_error(unrelated), kNoActiveExceptionMessage);

    std::ostringstream out;
    Printer printer{ConsoleWriter(out)};
    report_error(printer, unrelated);
    EXPECT_NE(out.str().find(std::string("\x1b[31m") + kNoActiveExceptionMessage + "\x1b[0m\n"), std::string::npos);
}

TEST(ErrorReporter, ReportPrintsRedWithTimestamp)
{
    std::ostringstream out;
    Printer printer{ConsoleWriter(out)};
    try {
        divide(4, 0);
    } catch (const std::exception& e) {
        report_error(printer, e);
    }
    const std::string s = out.str();
    EXPECT_EQ(s.rfind("\x1b[32m[", 0), 0u);
    EXPECT_NE(s.find("\x1b[31mLine #: "), std::string::npos);
    EXPECT_NE(s.find("causes the error. Error message: division by zero"), std::string::npos);
    EXPECT_TRUE(ends_with(s, "\x1b[0m\n"));
}

TEST(ErrorReporter, ReportWritesPlainTextToFile)
{
    const fs::path path = fs::temp_directory_path() / "safeprint_error_reporter" / "errors.log";
    fs::remove_all(path.parent_path());

    std::ostringstream out;
    Printer printer{ConsoleWriter(out)};
    try {
        throw std::runtime_error("boom");
    } catch (const std::exception& e) {
        report_error(printer, e, path.string(), 100);
    }

    const auto lines = RotatingLog(path).read_lines();
    ASSERT_GE(lines.size(), 2u);
    EXPECT_NE(lines[0].find("Line #: ? causes the error. Error message: boom"), std::string::npos);
    EXPECT_EQ(lines[0].find('\x1b'), std::string::npos);
    EXPECT_EQ(lines[1], "Traceback:");
    fs::remove_all(path.parent_path());
}
