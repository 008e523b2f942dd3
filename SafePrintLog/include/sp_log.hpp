#pragma once
/**
 * @file sp_log.hpp
 * @brief safeprint 내부 진단 로거 (콘솔 stderr + 선택적 파일, 크기 기반 로테이션)
 *
 * 제품 출력(safe_print)과는 별개로, 라이브러리/CLI 자체의 경고와 디버그 정보를 남긴다.
 * 호출 스레드에서 동기적으로 기록하며, 내부 mutex로 한 줄 단위 출력을 보장한다.
 */
#include <cstdarg>
#include <string>

namespace safeprint {

    // 레벨 순서(숫자가 작을수록 더 상세한 로그)
    // 우선순위(가장 상세 -> 가장 심각): Debug(0) > Info(1) > Trace(2) > Warn(3) > Error(4)
    enum class Lvl { Debug = 0, Info = 1, Trace = 2, Warn = 3, Error = 4 };

    // 로거 초기화 (앱 시작 시 호출)
    void init_logger(const std::string& log_dir, const std::string& filename,
                     int max_size_mb, int max_files, bool file_out, bool console_out);

    // 로거 종료 (앱 종료 시 호출). 이후 로그는 stderr 폴백 경로로 출력된다.
    void shutdown_logger();

    // 로그 레벨 설정/조회
    void set_level(Lvl l);
    Lvl level();

    // "debug" / "info" / "trace" / "warn" / "error" -> Lvl (알 수 없는 값은 fallback)
    Lvl level_from_string(const std::string& name, Lvl fallback = Lvl::Warn);

    // 로그 출력 함수
    void logf(Lvl lvl, const char *tag, const char *file, int line, const char *fmt, ...);

} // namespace safeprint

#define SP_LOG_DBG(tag, fmt, ...)                                              \
    ::safeprint::logf(::safeprint::Lvl::Debug, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define SP_LOG_INF(tag, fmt, ...)                                              \
    ::safeprint::logf(::safeprint::Lvl::Info, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define SP_LOG_WRN(tag, fmt, ...)                                              \
    ::safeprint::logf(::safeprint::Lvl::Warn, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define SP_LOG_ERR(tag, fmt, ...)                                              \
    ::safeprint::logf(::safeprint::Lvl::Error, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define SP_LOG_TRC(tag, fmt, ...)                                              \
    ::safeprint::logf(::safeprint::Lvl::Trace, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
