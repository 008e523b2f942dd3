#include "safeprint/rotating_log.hpp"

#include <fstream>
#include <iterator>

#include "safeprint/errors.hpp"
#include "safeprint/utf8.hpp"
#include "sp_log.hpp"

namespace fs = std::filesystem;

namespace safeprint {

RotatingLog::RotatingLog(fs::path path, std::size_t lines_limit)
    : path_(std::move(path)), lines_limit_(lines_limit)
{
}

void RotatingLog::ensure_exists() const
{
    // 디렉토리 생성 (실패 시 filesystem_error 그대로 전파)
    const fs::path dir = path_.parent_path();
    if (!dir.empty() && !fs::exists(dir)) {
        fs::create_directories(dir);
        SP_LOG_DBG("RotatingLog", "created directory %s", dir.string().c_str());
    }

    if (!fs::exists(path_)) {
        std::ofstream create(path_, std::ios::binary);
        if (!create.is_open()) {
            throw IoError("cannot create log file: " + path_.string());
        }
    } else if (!fs::is_regular_file(path_)) {
        throw IoError("log path is not a regular file: " + path_.string());
    }
}

std::vector<std::string> RotatingLog::read_lines() const
{
    std::vector<std::string> lines;
    if (!fs::exists(path_)) return lines;

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw IoError("cannot open log file for reading: " + path_.string());
    }

    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(repair_utf8(line, kUnicodeReplacement));
    }
    if (in.bad()) {
        throw IoError("failed to read log file: " + path_.string());
    }
    return lines;
}

void RotatingLog::write_lines(const std::vector<std::string>& lines) const
{
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IoError("cannot open log file for writing: " + path_.string());
    }
    for (const auto& l : lines) {
        out.write(l.data(), static_cast<std::streamsize>(l.size()));
        out.put('\n');
    }
    out.flush();
    if (!out) {
        throw IoError("failed to write log file: " + path_.string());
    }
}

void RotatingLog::prepend(std::string_view message) const
{
    ensure_exists();

    std::vector<std::string> existing = read_lines();

    // 메시지 내부 개행은 파일 줄 단위로 분리해서 줄 수 제한에 포함시킨다
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t nl = message.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(message.substr(start));
            break;
        }
        lines.emplace_back(message.substr(start, nl - start));
        start = nl + 1;
    }

    lines.insert(lines.end(), std::make_move_iterator(existing.begin()), std::make_move_iterator(existing.end()));
    if (lines.size() > lines_limit_) {
        lines.resize(lines_limit_);
    }

    write_lines(lines);
    SP_LOG_DBG("RotatingLog", "%s: %zu lines (limit %zu)", path_.string().c_str(), lines.size(), lines_limit_);
}

} // namespace safeprint
