#include "safeprint/utf8.hpp"

#include <cstdint>

namespace safeprint {

namespace {

/**
 * @brief bytes[i] 에서 시작하는 시퀀스 검사
 * @param consumed 실패 시 maximal subpart 길이(>=1)
 * @return 유효한 시퀀스 길이, 잘못된 경우 0
 */
std::size_t sequence_length(std::string_view bytes, std::size_t i, std::size_t& consumed)
{
    const auto b0 = static_cast<std::uint8_t>(bytes[i]);
    if (b0 < 0x80) return 1;

    std::size_t need = 0;
    std::uint8_t lo = 0x80;
    std::uint8_t hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
    } else if (b0 == 0xE0) {
        need = 2; lo = 0xA0;
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
        need = 2;
    } else if (b0 == 0xED) {
        need = 2; hi = 0x9F;  // surrogate 영역 제외
    } else if (b0 == 0xF0) {
        need = 3; lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        need = 3;
    } else if (b0 == 0xF4) {
        need = 3; hi = 0x8F;
    } else {
        // 0x80..0xC1, 0xF5..0xFF: 단독으로 잘못된 바이트
        consumed = 1;
        return 0;
    }

    for (std::size_t k = 1; k <= need; ++k) {
        if (i + k >= bytes.size()) {
            consumed = k;
            return 0;
        }
        const auto b = static_cast<std::uint8_t>(bytes[i + k]);
        const std::uint8_t min = (k == 1) ? lo : 0x80;
        const std::uint8_t max = (k == 1) ? hi : 0xBF;
        if (b < min || b > max) {
            consumed = k;
            return 0;
        }
    }
    return need + 1;
}

} // namespace

bool is_valid_utf8(std::string_view bytes)
{
    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t consumed = 0;
        const std::size_t n = sequence_length(bytes, i, consumed);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

std::string repair_utf8(std::string_view bytes, std::string_view replacement, bool replace_existing_fffd)
{
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t consumed = 0;
        const std::size_t n = sequence_length(bytes, i, consumed);
        if (n == 0) {
            out.append(replacement.data(), replacement.size());
            i += consumed;
            continue;
        }
        if (replace_existing_fffd && n == 3 && bytes.compare(i, 3, kUnicodeReplacement) == 0) {
            out.append(replacement.data(), replacement.size());
        } else {
            out.append(bytes.data() + i, n);
        }
        i += n;
    }
    return out;
}

} // namespace safeprint
