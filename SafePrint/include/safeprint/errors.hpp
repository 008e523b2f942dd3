#pragma once
/**
 * @file errors.hpp
 * @brief safeprint 예외 타입 정의
 *
 * 모든 예외는 std::runtime_error 에서 파생되므로 호출부는 `const std::exception&` 로 받을 수 있다.
 * TracedError 는 throw 지점(file/line/function)과 네이티브 backtrace 를 함께 보관하여
 * report_error() 가 "Line #" 과 Traceback 을 구성할 수 있게 한다.
 */
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace safeprint {

enum class ErrorCode : int {
    kInvalidArgument = 1,
    kOutOfRange      = 2,
    kConfig          = 3,
    kIo              = 4,
    kSanitize        = 5,
    kInternal        = 6,
};

const char* to_string(ErrorCode c) noexcept;

// 라이브러리 공통 기반 예외
class SafePrintError : public std::runtime_error {
public:
    explicit SafePrintError(const std::string& msg) : std::runtime_error(msg) {}
};

// 잘못된 색상 이름, 범위를 벗어난 설정값 등 호출부 설정 오류
class ConfigError : public SafePrintError {
public:
    explicit ConfigError(const std::string& msg) : SafePrintError(msg) {}
};

// 로그 파일 열기/읽기/쓰기 실패
class IoError : public SafePrintError {
public:
    explicit IoError(const std::string& msg) : SafePrintError(msg) {}
};

/**
 * @class TracedError
 * @brief throw 위치와 backtrace 를 함께 기록하는 예외
 *
 * 생성 시점에 호출 스택을 캡처한다(glibc execinfo). 지원하지 않는 플랫폼에서는 frames() 가 비어 있다.
 */
class TracedError : public SafePrintError {
public:
    TracedError(ErrorCode code, std::string message, const char* file, int line, const char* function);

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& file() const noexcept { return file_; }
    const std::string& function() const noexcept { return function_; }
    int line() const noexcept { return line_; }

    // 캡처된 네이티브 스택 프레임(심볼 문자열), 가장 안쪽 프레임이 먼저
    const std::vector<std::string>& frames() const noexcept { return frames_; }

private:
    ErrorCode code_;
    std::string message_;
    std::string file_;
    std::string function_;
    int line_;
    std::vector<std::string> frames_;
};

[[noreturn]] void throw_error(ErrorCode code, std::string message, const char* file, int line, const char* function);

inline void ensure(bool ok, ErrorCode code, std::string message, const char* file, int line, const char* function)
{
    if (!ok) {
        throw_error(code, std::move(message), file, line, function);
    }
}

// 현재 스택을 심볼 문자열 목록으로 캡처 (skip: 건너뛸 안쪽 프레임 수)
std::vector<std::string> capture_backtrace(int skip);

} // namespace safeprint

#define SP_THROW(CODE, MSG) ::safeprint::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
#define SP_ENSURE(EXPR, CODE, MSG) ::safeprint::ensure((EXPR), (CODE), (MSG), __FILE__, __LINE__, __func__)
