#pragma once
/**
 * @file app_config.hpp
 * @brief safe_print CLI 설정 (JSON 파일)
 *
 * "print" 섹션은 PrintOptions 의 기본값, "logging" 섹션은 내부 진단 로거 설정이다.
 * 명령행 옵션이 파일 값을 덮어쓴다.
 */
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "safeprint/printer.hpp"

class AppConfig {
public:
    struct LogConfig {
        bool file_output = false; // 파일 출력 선택
        std::string log_dir = "logs";
        std::string file_name = "safe_print.log";
        std::string level = "warn"; // debug, info, trace, warn, error
        bool console_output = true;
        int max_file_size_mb = 10;
        int max_backup_files = 5;
    };

    // Load configuration from a JSON file.
    // Returns true if successful, false otherwise (defaults stay in effect).
    bool load(const std::string& path);

    // Apply an already parsed document (used by load()).
    void apply(const nlohmann::json& j);

    // Throws safeprint::ConfigError on unknown color names or invalid (negative) limits.
    void validate() const;

    const safeprint::PrintOptions& print() const { return print_; }
    const LogConfig& logging() const { return logging_; }

    safeprint::PrintOptions& print() { return print_; }
    LogConfig& logging() { return logging_; }

private:
    safeprint::PrintOptions print_;
    LogConfig logging_;
    std::optional<long long> negative_lines_limit_;
};
