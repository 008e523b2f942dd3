#pragma once
/**
 * @file sanitizer.hpp
 * @brief 임의의 값 그래프 안의 잘못된 UTF-8 을 재귀적으로 복구
 *
 * - 텍스트/바이트열: 잘못된 최소 구간만 replacement 로 치환 (기존 U+FFFD 도 치환)
 * - 시퀀스/집합/매핑: 원소별 재귀, 같은 종류의 컨테이너로 재구성
 *   집합 원소가 복구 후 같아지면 하나로 합친다(먼저 나온 것 유지).
 *   매핑 키도 복구하며, 복구 후 같아진 키는 첫 위치에 하나로 합치고 값은 나중 것이 남는다.
 * - opaque: 내부를 검사하지 않고 그대로 통과
 *
 * sanitize() 는 절대 예외를 던지지 않는다. 내부 오류가 나면 report_error() 로 보고하고 원본을 돌려준다.
 */
#include <cstddef>
#include <string>
#include <string_view>

#include "safeprint/value.hpp"

namespace safeprint {

class Printer;

// 이보다 깊게 중첩된 값은 sanitize 실패로 처리한다
inline constexpr std::size_t kMaxSanitizeDepth = 1000;

/**
 * @brief try_sanitize() 결과
 * @details ok == false 면 value 는 입력 원본이고 failure 에 사유가 담긴다.
 */
struct SanitizeResult {
    Value value;
    bool ok = true;
    std::string failure;

    explicit operator bool() const { return ok; }
};

// 예외 없이 결과 타입으로 성공/실패를 구분
SanitizeResult try_sanitize(const Value& input, std::string_view replacement = " ");

// 전함수(total). 실패 시 오류를 Printer::instance() 로 보고하고 원본을 반환
Value sanitize(const Value& input, std::string_view replacement = " ");

// 위와 같되 실패 보고를 reporter 로 출력
Value sanitize(const Printer& reporter, const Value& input, std::string_view replacement = " ");

// 단일 텍스트 복구
std::string sanitize_text(std::string_view text, std::string_view replacement = " ");

} // namespace safeprint
