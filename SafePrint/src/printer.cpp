/**
 * @file printer.cpp
 * @brief Printer 구현: 장식/머리말 조합, 콘솔 출력, 로그 파일 기록
 */
#include "safeprint/printer.hpp"

#include <cstdio>
#include <ctime>

#include "safeprint/ansi_style.hpp"
#include "safeprint/sanitizer.hpp"
#include "safeprint/utf8.hpp"
#include "safeprint/value_format.hpp"

namespace safeprint {

DecorationSpec decoration_of(const PrintOptions& opts)
{
    DecorationSpec d;
    d.text_color = opts.text_color;
    d.highlight = opts.highlight;
    d.secondary_highlight = opts.secondary_highlight;
    d.error = opts.error;
    return d;
}

PrefixSpec prefix_of(const PrintOptions& opts)
{
    PrefixSpec p;
    p.show_time = opts.show_time;
    p.child_process_label = opts.child_process_label;
    p.label_color = opts.label_color;
    p.prefix = opts.prefix;
    p.prefix_color = opts.prefix_color;
    return p;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    // %p 는 로케일 의존이라 직접 계산
    const int hour12 = (tm.tm_hour % 12 == 0) ? 12 : tm.tm_hour % 12;
    const char* meridiem = (tm.tm_hour < 12) ? "AM" : "PM";

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%d:%02d %s - %02d/%02d/%04d", hour12, tm.tm_min, meridiem,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_year + 1900);
    return std::string(buf);
}

std::string decorate(std::string_view text, const DecorationSpec& spec)
{
    std::string out(text);

    // highlight 가 안쪽, secondary_highlight 가 바깥쪽으로 감싼다
    if (spec.highlight) {
        out = wrap_style(out, fore("BLACK") + back("LIGHTYELLOW_EX"));
    }
    if (spec.secondary_highlight) {
        out = wrap_style(out, fore("LIGHTYELLOW_EX") + back("BLACK"));
    }

    const std::string color = spec.error ? std::string("RED") : spec.text_color;
    if (!color.empty()) {
        out = wrap_style(out, fore(color));
    }
    return out;
}

std::string build_prefix(const PrefixSpec& spec, std::chrono::system_clock::time_point now)
{
    std::string out;
    if (spec.show_time) {
        out += wrap_style("[" + format_timestamp(now) + "]", fore("GREEN"));
        out += ' ';
    }
    if (!spec.child_process_label.empty()) {
        out += wrap_style("[Child " + sanitize_text(spec.child_process_label) + " Process]", fore(spec.label_color));
        out += ' ';
    }
    if (!spec.prefix.empty()) {
        out += wrap_style("[" + sanitize_text(spec.prefix) + "]", fore(spec.prefix_color));
        out += ' ';
    }
    return out;
}

Printer& Printer::instance()
{
    static Printer inst;
    return inst;
}

Printer::Printer(ConsoleWriter console, Clock clock)
    : console_(console), clock_(std::move(clock))
{
}

std::chrono::system_clock::time_point Printer::now() const
{
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::string Printer::compose(const Value& value, const PrintOptions& opts) const
{
    const Value clean = sanitize(*this, value);
    const std::string body = decorate(render_text(clean), decoration_of(opts));
    return build_prefix(prefix_of(opts), now()) + body;
}

void Printer::print(const Value& value, const PrintOptions& opts) const
{
    // opaque repr 등 sanitize 대상이 아닌 구간이 남아 있을 수 있으므로 출력 직전 '?' 로 치환
    const std::string output = repair_utf8(compose(value, opts), "?");

    // 콘솔이 먼저. 콘솔 실패(IoError)는 그대로 전파되고 로그 파일은 건드리지 않는다
    console_.write_line(output);

    if (!opts.file_path.empty()) {
        RotatingLog log(opts.file_path, opts.file_lines_limit);
        log.prepend(strip_ansi(output));
    }
}

void safe_print(const Value& value, const PrintOptions& opts)
{
    Printer::instance().print(value, opts);
}

} // namespace safeprint
