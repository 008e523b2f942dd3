#pragma once
/**
 * @file value_format.hpp
 * @brief Value <-> JSON 변환 및 출력용 텍스트 직렬화
 *
 * 시퀀스/매핑은 4칸 들여쓰기 JSON 으로, 그 외 값은 자연스러운 텍스트 표현으로 렌더링한다.
 */
#include <string>

#include <nlohmann/json.hpp>

#include "safeprint/value.hpp"

namespace safeprint {

// 구조형 값 pretty-print 들여쓰기 폭
inline constexpr int kPrettyIndent = 4;

/**
 * @brief Value -> ordered_json (키 삽입 순서 유지)
 * @details 집합은 배열로, 바이트열은 문자열로, opaque 는 repr 문자열로,
 *          NaN/무한대는 "nan" / "inf" / "-inf" 문자열로 변환된다.
 */
nlohmann::ordered_json to_json(const Value& v);

/**
 * @brief JSON -> Value
 * @details 객체는 ValueMap, 배열은 Sequence, binary 는 Bytes 로 변환된다.
 */
Value from_json(const nlohmann::ordered_json& j);

/**
 * @brief 콘솔/로그 출력용 텍스트 표현
 * @return 시퀀스/매핑: pretty JSON, 텍스트: 원문, 그 외: null / true / 숫자(nan, inf 포함) / {a, b} / repr
 */
std::string render_text(const Value& v);

} // namespace safeprint
