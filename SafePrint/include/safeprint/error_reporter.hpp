#pragma once
/**
 * @file error_reporter.hpp
 * @brief 현재 처리 중인 예외의 정보(줄 번호, 메시지, traceback)를 빨간색으로 출력
 *
 * 반드시 catch 블록 안에서 호출해야 한다. 활성 예외가 없으면 고정 안내 문구를 출력한다.
 *
 * 사용 예:
 * @code
 *   try {
 *       SP_THROW(safeprint::ErrorCode::kInvalidArgument, "division by zero");
 *   } catch (const std::exception& e) {
 *       safeprint::report_error(e, "logs/errors.log");
 *   }
 * @endcode
 */
#include <cstddef>
#include <exception>
#include <string>

#include "safeprint/rotating_log.hpp"

namespace safeprint {

class Printer;

inline constexpr const char* kNoActiveExceptionMessage =
    "No active exception to retrieve context from. "
    "This function should be called within an error-handling scope.";

/**
 * @brief 보고 문자열 생성 (출력 없음)
 * @return "Line #: <line> causes the error. Error message: <msg>\nTraceback:\n<trace>"
 *         활성 예외가 없으면 kNoActiveExceptionMessage
 */
std::string describe_active_error(const std::exception& error);

// Printer::instance() 로 출력
void report_error(const std::exception& error, const std::string& file_path = std::string(),
                  std::size_t file_lines_limit = kDefaultFileLinesLimit);

void report_error(const Printer& printer, const std::exception& error, const std::string& file_path = std::string(),
                  std::size_t file_lines_limit = kDefaultFileLinesLimit);

} // namespace safeprint
