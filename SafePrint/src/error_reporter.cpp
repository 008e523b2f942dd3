/**
 * @file error_reporter.cpp
 * @brief 활성 예외 컨텍스트를 읽어 Printer 로 보고
 */
#include "safeprint/error_reporter.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

#include "safeprint/errors.hpp"
#include "safeprint/printer.hpp"

namespace safeprint {

namespace {

std::string demangle(const char* name)
{
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> res(abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && res) return std::string(res.get());
#endif
    return std::string(name);
}

std::string message_of(const std::exception& error)
{
    if (const auto* traced = dynamic_cast<const TracedError*>(&error)) {
        return traced->message();
    }
    return error.what();
}

std::string format_trace(const TracedError& t)
{
    std::ostringstream oss;
    oss << "  File \"" << t.file() << "\", line " << t.line() << ", in " << t.function() << "\n";
    for (const auto& frame : t.frames()) {
        oss << "    " << frame << "\n";
    }
    return oss.str();
}

} // namespace

std::string describe_active_error(const std::exception& error)
{
    std::exception_ptr active = std::current_exception();
    if (!active) {
        return kNoActiveExceptionMessage;
    }

    std::string line = "?";
    std::string trace;
    try {
        std::rethrow_exception(active);
    } catch (const TracedError& t) {
        line = std::to_string(t.line());
        trace = format_trace(t);
    } catch (const std::exception& e) {
        trace = "  (no trace recorded for " + demangle(typeid(e).name()) + ")\n";
    } catch (...) {
        trace = "  (no trace recorded for non-standard exception)\n";
    }

    std::ostringstream oss;
    oss << "Line #: " << line << " causes the error. Error message: " << message_of(error)
        << "\nTraceback:\n" << trace;
    return oss.str();
}

void report_error(const std::exception& error, const std::string& file_path, std::size_t file_lines_limit)
{
    report_error(Printer::instance(), error, file_path, file_lines_limit);
}

void report_error(const Printer& printer, const std::exception& error, const std::string& file_path,
                  std::size_t file_lines_limit)
{
    PrintOptions opts;
    opts.error = true;
    opts.file_path = file_path;
    opts.file_lines_limit = file_lines_limit;
    printer.print(describe_active_error(error), opts);
}

} // namespace safeprint
