#include "cli_args.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "safeprint/safeprint.hpp"
#include "sp_log.hpp"

void print_usage(std::ostream& os)
{
    os << "usage: safe_print [options] [input-file]\n"
          "  --label <text>           child process label\n"
          "  --label-color <color>    color of the child process label (default RED)\n"
          "  --prefix <text>          custom prefix\n"
          "  --prefix-color <color>   color of the custom prefix (default GREEN)\n"
          "  --color <color>          text color\n"
          "  --highlight              dark text on bright yellow\n"
          "  --secondary-highlight    bright yellow text on black\n"
          "  --file <path>            rotating log file\n"
          "  --lines <n>              log file line limit (default 10000)\n"
          "  --no-time                omit the timestamp\n"
          "  --error                  force red text\n"
          "  --raw                    treat input as bytes, not JSON\n"
          "  --config <path>          JSON config (default safe_print.json if present)\n"
          "  --dry-run                print to the console only, skip the log file\n"
          "colors: ";
    bool first = true;
    for (const auto& name : safeprint::color_names()) {
        os << (first ? "" : ", ") << name;
        first = false;
    }
    os << "\n";
}

CliArgs parse_args(int argc, char** argv, AppConfig& config)
{
    CliArgs args;
    auto& opts = config.print();

    // 1차: --config 먼저 찾아서 로드 (명령행 옵션이 우선하도록)
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) args.config_path = argv[i + 1];
    }
    const bool explicit_config = !args.config_path.empty();
    if (!explicit_config) args.config_path = kDefaultConfigPath;
    if (explicit_config || std::filesystem::exists(args.config_path)) {
        if (!config.load(args.config_path) && explicit_config) {
            throw safeprint::ConfigError("cannot load config file: " + args.config_path);
        }
    }

    auto next = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw safeprint::ConfigError("missing value for " + flag);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") args.help = true;
        else if (a == "--config") next(i, a);
        else if (a == "--label") opts.child_process_label = next(i, a);
        else if (a == "--label-color") opts.label_color = next(i, a);
        else if (a == "--prefix") opts.prefix = next(i, a);
        else if (a == "--prefix-color") opts.prefix_color = next(i, a);
        else if (a == "--color") opts.text_color = next(i, a);
        else if (a == "--highlight") opts.highlight = true;
        else if (a == "--secondary-highlight") opts.secondary_highlight = true;
        else if (a == "--file") opts.file_path = next(i, a);
        else if (a == "--lines") {
            const std::string v = next(i, a);
            try {
                if (v.empty() || v[0] == '-' || v[0] == '+') throw std::invalid_argument(v);
                std::size_t pos = 0;
                const unsigned long long n = std::stoull(v, &pos);
                if (pos != v.size()) throw std::invalid_argument(v);
                opts.file_lines_limit = static_cast<std::size_t>(n);
            } catch (const std::exception&) {
                throw safeprint::ConfigError("invalid --lines value: " + v);
            }
        }
        else if (a == "--no-time") opts.show_time = false;
        else if (a == "--error") opts.error = true;
        else if (a == "--raw") args.raw = true;
        else if (a == "--dry-run") args.dry_run = true;
        else if (!a.empty() && a[0] == '-' && a != "-") throw safeprint::ConfigError("unknown option: " + a);
        else if (args.input_path.empty()) args.input_path = (a == "-") ? std::string() : a;
        else throw safeprint::ConfigError("unexpected argument: " + a);
    }
    return args;
}

std::string read_input(const std::string& path)
{
    if (path.empty()) {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw safeprint::IoError("cannot open input file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

safeprint::Value to_value(std::string input, bool raw)
{
    if (!raw) {
        auto j = nlohmann::ordered_json::parse(input, nullptr, false);
        if (!j.is_discarded()) {
            return safeprint::from_json(j);
        }
        SP_LOG_DBG("Main", "input is not JSON, printing as bytes");
    }
    // echo 등으로 들어온 마지막 개행 하나는 출력 개행과 겹치므로 제거
    if (!input.empty() && input.back() == '\n') input.pop_back();
    return safeprint::Value(safeprint::Bytes(input.begin(), input.end()));
}

int run_cli(int argc, char** argv)
{
    // 1. Configuration + CLI override
    AppConfig config;
    CliArgs args;
    try {
        args = parse_args(argc, argv, config);
        config.validate();
    } catch (const safeprint::ConfigError& e) {
        std::cerr << "safe_print: " << e.what() << "\n";
        print_usage(std::cerr);
        return 2;
    }

    if (args.help) {
        print_usage(std::cout);
        return 0;
    }

    // 2. Initialize diagnostics logger
    const auto& log_cfg = config.logging();
    if (log_cfg.file_output || log_cfg.console_output) {
        safeprint::init_logger(log_cfg.log_dir, log_cfg.file_name,
                               log_cfg.max_file_size_mb, log_cfg.max_backup_files,
                               log_cfg.file_output, log_cfg.console_output);
    }
    safeprint::set_level(safeprint::level_from_string(log_cfg.level));

    safeprint::PrintOptions opts = config.print();
    if (args.dry_run) opts.file_path.clear();

    // 3. Read, convert and print
    int rc = 0;
    try {
        safeprint::Value value = to_value(read_input(args.input_path), args.raw);
        safeprint::safe_print(value, opts);
        SP_LOG_DBG("Main", "printed %s value", safeprint::to_string(value.kind()));
    } catch (const safeprint::ConfigError& e) {
        std::cerr << "safe_print: " << e.what() << "\n";
        rc = 2;
    } catch (const std::exception& e) {
        rc = 1;
        try {
            safeprint::report_error(e);
        } catch (const std::exception& re) {
            // 콘솔 자체가 실패한 경우 진단 로그만 남는다
            SP_LOG_ERR("Main", "cannot report error '%s': %s", e.what(), re.what());
        }
    }

    safeprint::shutdown_logger();
    return rc;
}
