#pragma once
/**
 * @file utf8.hpp
 * @brief 바이트 단위 UTF-8 검증/복구 유틸리티
 *
 * 복구 정책은 Unicode "maximal subpart 치환" 방식이다. 잘못된 구간 하나(최대 부분 시퀀스)만
 * replacement 로 바꾸고 나머지 유효한 문자는 그대로 보존한다.
 */
#include <string>
#include <string_view>

namespace safeprint {

// U+FFFD REPLACEMENT CHARACTER (UTF-8)
inline constexpr std::string_view kUnicodeReplacement = "\xEF\xBF\xBD";

bool is_valid_utf8(std::string_view bytes);

/**
 * @brief 잘못된 UTF-8 구간을 replacement 로 치환
 * @param bytes 임의의 바이트열
 * @param replacement 치환 문자열 (유효한 UTF-8 이어야 결과가 유효하다)
 * @param replace_existing_fffd true 면 원래 들어 있던 U+FFFD 도 replacement 로 바꾼다
 * @return 복구된 문자열
 */
std::string repair_utf8(std::string_view bytes, std::string_view replacement, bool replace_existing_fffd = false);

} // namespace safeprint
