#pragma once
/**
 * @file rotating_log.hpp
 * @brief 최신 줄이 맨 앞에 오는, 줄 수 제한이 있는 평문 로그 파일
 *
 * 호출마다 파일 전체를 읽고 -> 새 줄을 앞에 삽입 -> 제한 줄 수로 자른 뒤 -> 전체를 다시 쓴다.
 * 호출 간 메모리 캐시는 없다.
 *
 * 스레드/프로세스 안전성:
 * - 잠금이나 원자적 rename 을 쓰지 않는다. 같은 경로에 동시에 쓰면 갱신이 유실될 수 있으므로
 *   필요하면 호출부에서 직렬화해야 한다.
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace safeprint {

inline constexpr std::size_t kDefaultFileLinesLimit = 10000;

class RotatingLog {
public:
    RotatingLog(std::filesystem::path path, std::size_t lines_limit = kDefaultFileLinesLimit);

    /**
     * @brief 메시지를 맨 앞에 추가하고 파일을 다시 쓴다
     * @param message 색상 코드가 제거된 평문 (내부 개행은 그대로 여러 줄이 된다)
     * @throws IoError 파일 열기/쓰기 실패, 경로가 일반 파일이 아님
     * @throws std::filesystem::filesystem_error 디렉토리 생성 실패 등
     */
    void prepend(std::string_view message) const;

    /**
     * @brief 현재 파일의 줄 목록 (개행 제외, 최신 줄이 먼저)
     * @details 파일이 없으면 빈 목록. 잘못된 UTF-8 은 U+FFFD 로 치환된다.
     */
    std::vector<std::string> read_lines() const;

    const std::filesystem::path& path() const { return path_; }
    std::size_t lines_limit() const { return lines_limit_; }

private:
    void ensure_exists() const;
    void write_lines(const std::vector<std::string>& lines) const;

    std::filesystem::path path_;
    std::size_t lines_limit_;
};

} // namespace safeprint
