/**
 * @file sanitizer.cpp
 * @brief Value 에 대한 구조적 재귀 sanitize 구현
 */
#include "safeprint/sanitizer.hpp"

#include <variant>

#include "safeprint/error_reporter.hpp"
#include "safeprint/errors.hpp"
#include "safeprint/printer.hpp"
#include "safeprint/utf8.hpp"
#include "sp_log.hpp"

namespace safeprint {

namespace {

Value sanitize_value(const Value& input, std::string_view replacement, std::size_t depth);

struct SanitizeVisitor {
    std::string_view replacement;
    std::size_t depth;

    Value operator()(std::nullptr_t) const { return Value(); }
    Value operator()(bool b) const { return Value(b); }
    Value operator()(std::int64_t n) const { return Value(n); }
    Value operator()(double d) const { return Value(d); }

    Value operator()(const std::string& s) const { return Value(sanitize_text(s, replacement)); }

    // 바이트열은 텍스트로 해석한 뒤 같은 복구 단계를 거친다
    Value operator()(const Bytes& b) const
    {
        std::string_view raw(reinterpret_cast<const char*>(b.data()), b.size());
        return Value(sanitize_text(raw, replacement));
    }

    Value operator()(const Sequence& seq) const
    {
        Sequence out;
        out.reserve(seq.size());
        for (const auto& item : seq) {
            out.push_back(sanitize_value(item, replacement, depth + 1));
        }
        return Value(std::move(out));
    }

    Value operator()(const ValueSet& set) const
    {
        ValueSet out;
        for (const auto& item : set) {
            out.insert(sanitize_value(item, replacement, depth + 1));
        }
        return Value(std::move(out));
    }

    Value operator()(const ValueMap& map) const
    {
        ValueMap out;
        for (std::size_t i = 0; i < map.size(); ++i) {
            // 복구 후 겹치는 키는 set() 이 첫 위치에 합친다
            out.set(sanitize_text(map.key_at(i), replacement),
                    sanitize_value(map.value_at(i), replacement, depth + 1));
        }
        return Value(std::move(out));
    }

    Value operator()(const Opaque& o) const { return Value(o); }
};

Value sanitize_value(const Value& input, std::string_view replacement, std::size_t depth)
{
    if (depth > kMaxSanitizeDepth) {
        SP_THROW(ErrorCode::kSanitize,
                 "value nesting exceeds " + std::to_string(kMaxSanitizeDepth) + " levels");
    }
    return std::visit(SanitizeVisitor{replacement, depth}, input.storage());
}

Value sanitize_checked(const Value& input, std::string_view replacement)
{
    SP_ENSURE(is_valid_utf8(replacement), ErrorCode::kInvalidArgument,
              "replacement character is not valid UTF-8");
    return sanitize_value(input, replacement, 0);
}

// 오류 보고 중 다시 sanitize 오류가 나면 콘솔 보고 대신 진단 로그만 남긴다
thread_local bool t_reporting_fault = false;

struct ReportingScope {
    ReportingScope() { t_reporting_fault = true; }
    ~ReportingScope() { t_reporting_fault = false; }
};

} // namespace

std::string sanitize_text(std::string_view text, std::string_view replacement)
{
    return repair_utf8(text, replacement, true);
}

SanitizeResult try_sanitize(const Value& input, std::string_view replacement)
{
    try {
        return SanitizeResult{sanitize_checked(input, replacement), true, {}};
    } catch (const std::exception& e) {
        SP_LOG_DBG("Sanitizer", "sanitize failed: %s", e.what());
        return SanitizeResult{input, false, e.what()};
    }
}

Value sanitize(const Value& input, std::string_view replacement)
{
    return sanitize(Printer::instance(), input, replacement);
}

Value sanitize(const Printer& reporter, const Value& input, std::string_view replacement)
{
    try {
        return sanitize_checked(input, replacement);
    } catch (const std::exception& e) {
        if (t_reporting_fault) {
            SP_LOG_ERR("Sanitizer", "sanitize failed while reporting a previous fault: %s", e.what());
            return input;
        }
        ReportingScope scope;
        try {
            // catch 블록 안이므로 report_error() 가 활성 예외 컨텍스트를 읽을 수 있다
            report_error(reporter, e);
        } catch (const std::exception& re) {
            SP_LOG_ERR("Sanitizer", "failed to report sanitize fault: %s (original: %s)", re.what(), e.what());
        }
        return input;
    }
}

} // namespace safeprint
