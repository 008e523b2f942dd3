#pragma once
/**
 * @file console_writer.hpp
 * @brief 콘솔 출력 경로 (raw 바이트 FILE* 또는 텍스트 std::ostream)
 *
 * 기본은 stdout 에 바이트를 그대로 쓴다. 테스트 캡처처럼 raw 스트림이 없는 환경에서는
 * std::ostream 텍스트 경로로 대체한다. 출력 실패는 IoError 로 호출부에 전파된다.
 */
#include <cstdio>
#include <ostream>
#include <string_view>

namespace safeprint {

class ConsoleWriter {
public:
    // 기본 stdout raw 경로
    ConsoleWriter() : raw_(stdout) {}
    explicit ConsoleWriter(std::FILE* raw) : raw_(raw) {}
    explicit ConsoleWriter(std::ostream& text) : text_(&text) {}

    /**
     * @brief 한 줄 출력 (line 뒤에 개행 하나를 붙인다)
     * @throws IoError 쓰기/flush 실패, 또는 출력 대상이 없음
     */
    void write_line(std::string_view line) const;

    bool is_raw() const { return raw_ != nullptr; }

private:
    std::FILE* raw_ = nullptr;
    std::ostream* text_ = nullptr;
};

} // namespace safeprint
