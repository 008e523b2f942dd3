/**
 * @file errors.cpp
 * @brief TracedError 생성 및 backtrace 캡처 구현
 */
#include "safeprint/errors.hpp"

#include <cstdlib>

#if defined(__GLIBC__)
#include <execinfo.h>
#endif

namespace safeprint {

const char* to_string(ErrorCode c) noexcept
{
    switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kOutOfRange:      return "OutOfRange";
    case ErrorCode::kConfig:          return "Config";
    case ErrorCode::kIo:              return "Io";
    case ErrorCode::kSanitize:        return "Sanitize";
    case ErrorCode::kInternal:        return "Internal";
    }
    return "Unknown";
}

std::vector<std::string> capture_backtrace(int skip)
{
    std::vector<std::string> out;
#if defined(__GLIBC__)
    void* frames[64];
    int n = ::backtrace(frames, 64);
    if (n <= 0) return out;

    // backtrace_symbols() 는 malloc 한 배열을 돌려준다. 개별 문자열은 해제하지 않는다.
    char** symbols = ::backtrace_symbols(frames, n);
    if (!symbols) return out;

    // frame 0 은 capture_backtrace 자신
    for (int i = skip + 1; i < n; ++i) {
        out.emplace_back(symbols[i] ? symbols[i] : "??");
    }
    std::free(symbols);
#else
    (void)skip;
#endif
    return out;
}

TracedError::TracedError(ErrorCode code, std::string message, const char* file, int line, const char* function)
    : SafePrintError(message),
      code_(code),
      message_(std::move(message)),
      file_(file ? file : ""),
      function_(function ? function : ""),
      line_(line),
      frames_(capture_backtrace(1))
{
}

void throw_error(ErrorCode code, std::string message, const char* file, int line, const char* function)
{
    throw TracedError(code, std::move(message), file, line, function);
}

} // namespace safeprint
