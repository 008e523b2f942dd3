#pragma once
/**
 * @file printer.hpp
 * @brief 값 정리 -> 직렬화 -> 색상 장식 -> prefix 조합 -> 콘솔 출력 -> (선택) 로그 파일 기록
 *
 * 처리 순서:
 *   1. sanitize()      잘못된 UTF-8 복구
 *   2. render_text()   시퀀스/매핑은 pretty JSON, 그 외는 텍스트 표현
 *   3. decorate()      highlight / secondary_highlight / text_color (error 면 RED 강제)
 *   4. build_prefix()  [시각] [Child <label> Process] [<prefix>]
 *   5. 콘솔 출력       개행 정확히 하나
 *   6. file_path 가 있으면 ANSI 코드를 제거한 평문을 RotatingLog 에 추가
 *
 * 연관 파일:
 *   - sanitizer.hpp, value_format.hpp, ansi_style.hpp, rotating_log.hpp, console_writer.hpp
 */
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "safeprint/console_writer.hpp"
#include "safeprint/rotating_log.hpp"
#include "safeprint/value.hpp"

namespace safeprint {

/**
 * @brief 출력 옵션 (빈 문자열 = 지정 안 함)
 */
struct PrintOptions {
    std::string child_process_label;
    std::string label_color = "RED";
    std::string prefix;
    std::string prefix_color = "GREEN";
    std::string text_color;
    bool highlight = false;
    bool secondary_highlight = false;
    std::string file_path;
    std::size_t file_lines_limit = kDefaultFileLinesLimit;
    bool show_time = true;
    bool error = false;
};

// 본문 장식 설정
struct DecorationSpec {
    std::string text_color;
    bool highlight = false;
    bool secondary_highlight = false;
    bool error = false;
};

// 머리말 설정
struct PrefixSpec {
    bool show_time = true;
    std::string child_process_label;
    std::string label_color = "RED";
    std::string prefix;
    std::string prefix_color = "GREEN";
};

DecorationSpec decoration_of(const PrintOptions& opts);
PrefixSpec prefix_of(const PrintOptions& opts);

// 로케일과 무관한 "H:MM AM - MM/DD/YYYY" (로컬 시간, 시는 앞자리 0 없음)
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// 본문에 장식을 적용. 알 수 없는 색상 이름이면 ConfigError
std::string decorate(std::string_view text, const DecorationSpec& spec);

// 머리말 조합. 각 세그먼트 뒤에 공백 하나. 알 수 없는 색상 이름이면 ConfigError
std::string build_prefix(const PrefixSpec& spec, std::chrono::system_clock::time_point now);

class Printer {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // 프로세스 전역 printer (stdout)
    static Printer& instance();

    Printer() = default;
    explicit Printer(ConsoleWriter console, Clock clock = Clock());

    /**
     * @brief 개행 전의 최종 출력 문자열 조합
     * @details 정상 경로에서는 부작용이 없다. sanitize 실패 시에만 그 보고가 이 printer 의 콘솔로 나간다.
     * @throws ConfigError 알 수 없는 색상 이름
     */
    std::string compose(const Value& value, const PrintOptions& opts) const;

    /**
     * @brief 콘솔 출력 + (file_path 지정 시) 로그 파일 기록
     * @throws ConfigError 알 수 없는 색상 이름 (출력 전에 실패)
     * @throws IoError 콘솔 쓰기 실패 (로그 파일은 기록하지 않음)
     * @throws IoError, std::filesystem::filesystem_error 로그 파일 오류 (콘솔 출력 이후)
     */
    void print(const Value& value, const PrintOptions& opts) const;

    const ConsoleWriter& console() const { return console_; }

private:
    std::chrono::system_clock::time_point now() const;

    ConsoleWriter console_;
    Clock clock_;
};

// Printer::instance().print(value, opts)
void safe_print(const Value& value, const PrintOptions& opts = PrintOptions());

} // namespace safeprint
