/**
 * @file main.cpp
 * safe_print CLI 엔트리 포인트.
 * 입력 파일(또는 stdin)을 JSON 으로 해석해 Value 로 만들고, 실패하면 바이트열로 취급하여 출력한다.
 */

#include "cli_args.hpp"

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
