#include "app_config.hpp"

#include <fstream>
#include <string>

#include "safeprint/ansi_style.hpp"
#include "safeprint/errors.hpp"
#include "sp_log.hpp"

bool AppConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SP_LOG_INF("Config", "config file not found: %s", path.c_str());
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        apply(j);
        return true;
    } catch (const std::exception& e) {
        SP_LOG_WRN("Config", "error parsing config file %s: %s", path.c_str(), e.what());
        return false;
    }
}

void AppConfig::apply(const nlohmann::json& j) {
    // Print defaults
    if (j.contains("print")) {
        const auto& p = j.at("print");
        print_.child_process_label = p.value("child_process_label", print_.child_process_label);
        print_.label_color = p.value("label_color", print_.label_color);
        print_.prefix = p.value("prefix", print_.prefix);
        print_.prefix_color = p.value("prefix_color", print_.prefix_color);
        print_.text_color = p.value("text_color", print_.text_color);
        print_.highlight = p.value("highlight", print_.highlight);
        print_.secondary_highlight = p.value("secondary_highlight", print_.secondary_highlight);
        print_.file_path = p.value("file_path", print_.file_path);
        // size_t 로 바로 읽으면 음수가 거대한 값으로 바뀐다. validate() 에서 거부한다
        const long long lines = p.value("file_lines_limit", static_cast<long long>(print_.file_lines_limit));
        if (lines < 0) {
            negative_lines_limit_ = lines;
        } else {
            negative_lines_limit_.reset();
            print_.file_lines_limit = static_cast<std::size_t>(lines);
        }
        print_.show_time = p.value("show_time", print_.show_time);
        print_.error = p.value("error", print_.error);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& log = j.at("logging");
        logging_.file_output = log.value("file_output", logging_.file_output);
        logging_.log_dir = log.value("log_dir", logging_.log_dir);
        logging_.file_name = log.value("file_name", logging_.file_name);
        logging_.level = log.value("level", logging_.level);
        logging_.console_output = log.value("console_output", logging_.console_output);
        logging_.max_file_size_mb = log.value("max_file_size_mb", logging_.max_file_size_mb);
        logging_.max_backup_files = log.value("max_backup_files", logging_.max_backup_files);
    }
}

void AppConfig::validate() const {
    auto check_color = [](const std::string& field, const std::string& name) {
        if (!name.empty() && !safeprint::find_fore_code(name)) {
            throw safeprint::ConfigError(field + ": unknown color name '" + name + "'");
        }
    };
    check_color("print.label_color", print_.label_color);
    check_color("print.prefix_color", print_.prefix_color);
    check_color("print.text_color", print_.text_color);

    if (negative_lines_limit_) {
        throw safeprint::ConfigError("print.file_lines_limit must be >= 0 (got " +
                                     std::to_string(*negative_lines_limit_) + ")");
    }
    if (logging_.max_file_size_mb < 0) {
        throw safeprint::ConfigError("logging.max_file_size_mb must be >= 0");
    }
    if (logging_.max_backup_files < 0) {
        throw safeprint::ConfigError("logging.max_backup_files must be >= 0");
    }
}
