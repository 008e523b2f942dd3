#pragma once
/**
 * @file ansi_style.hpp
 * @brief 색상 이름 -> ANSI 이스케이프 정적 매핑과 이스케이프 제거
 *
 * 전역 "현재 색상" 상태를 두지 않는다. 모든 장식은 호출마다 (열기 코드 + 텍스트 + reset) 쌍으로 조합한다.
 * 색상 이름은 대소문자를 구분하지 않으며, 알 수 없는 이름은 ConfigError 로 즉시 실패한다.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safeprint {

// Style.RESET_ALL
inline constexpr std::string_view kStyleReset = "\x1b[0m";

// 인식 가능한 색상 이름 목록 (대문자)
const std::vector<std::string>& color_names();

// 전경색 SGR 코드 (예: "red" -> 31). 없으면 nullopt
std::optional<int> find_fore_code(std::string_view name);

// 배경색 SGR 코드 (예: "LIGHTYELLOW_EX" -> 103). 없으면 nullopt
std::optional<int> find_back_code(std::string_view name);

// 전경/배경 이스케이프 시퀀스. 알 수 없는 이름이면 ConfigError
std::string fore(std::string_view name);
std::string back(std::string_view name);

// open + text + reset
std::string wrap_style(std::string_view text, std::string_view open);

// ESC [@-_] [0-?]* [ -/]* [@-~] 형태의 이스케이프를 모두 제거
std::string strip_ansi(std::string_view text);

} // namespace safeprint
