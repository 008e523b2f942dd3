#pragma once
/**
 * @file cli_args.hpp
 * @brief safe_print 명령행 처리 (인자 파싱, 입력 변환, 실행)
 *
 * 우선순위: 내장 기본값 < 설정 파일(--config, 없으면 safe_print.json) < 명령행 옵션
 * 종료 코드: 0 성공, 1 입출력 오류(report_error 로 보고), 2 사용법/설정 오류
 */
#include <ostream>
#include <string>

#include "app_config.hpp"
#include "safeprint/value.hpp"

constexpr const char* kDefaultConfigPath = "safe_print.json";

struct CliArgs {
    std::string config_path;
    std::string input_path;   // empty = stdin
    bool raw = false;
    bool dry_run = false;
    bool help = false;
};

void print_usage(std::ostream& os);

// 설정 파일을 config 에 로드한 뒤 명령행 옵션으로 덮어쓴다. 잘못된 사용이면 ConfigError
CliArgs parse_args(int argc, char** argv, AppConfig& config);

// 입력 파일(빈 경로면 stdin) 전체를 바이트 그대로 읽는다. 열 수 없으면 IoError
std::string read_input(const std::string& path);

// JSON 으로 해석되면 그 값, 아니면(또는 raw) 마지막 개행 하나를 뗀 바이트열
safeprint::Value to_value(std::string input, bool raw);

// main() 본체. 종료 코드를 돌려준다
int run_cli(int argc, char** argv);
