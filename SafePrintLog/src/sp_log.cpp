#include "sp_log.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace safeprint {

    static std::atomic<Lvl> g_current_level{Lvl::Warn};

    void set_level(Lvl l) {
        g_current_level = l;
    }

    Lvl level() {
        return g_current_level;
    }

    Lvl level_from_string(const std::string& name, Lvl fallback) {
        if (name == "debug") return Lvl::Debug;
        if (name == "info") return Lvl::Info;
        if (name == "trace") return Lvl::Trace;
        if (name == "warn") return Lvl::Warn;
        if (name == "error") return Lvl::Error;
        return fallback;
    }

    struct LogEntry {
        Lvl level;
        std::string timestamp;
        std::string thread_id;
        std::string tag;
        std::string file;
        int line;
        std::string message;
    };

    static const char* level_tag(Lvl lvl) {
        switch (lvl) {
            case Lvl::Debug: return "DBG";
            case Lvl::Info:  return "INF";
            case Lvl::Trace: return "TRC";
            case Lvl::Warn:  return "WRN";
            case Lvl::Error: return "ERR";
        }
        return "INF";
    }

    static const char* level_color(Lvl lvl) {
        switch (lvl) {
            case Lvl::Debug: return "\033[90m";  // 회색
            case Lvl::Info:  return "\033[37m";  // 흰색
            case Lvl::Trace: return "\033[36m";  // 청록색
            case Lvl::Warn:  return "\033[33m";  // 노란색
            case Lvl::Error: return "\033[31m";  // 빨간색
        }
        return "";
    }

    class DiagLogger {
    public:
        static DiagLogger& instance() {
            static DiagLogger inst;
            return inst;
        }

        void start(const std::string& dir, const std::string& file, int max_mb, int backups, bool file_out, bool console) {
            std::lock_guard<std::mutex> lock(mutex_);
            log_dir_ = dir;
            base_filename_ = file;
            max_file_size_ = static_cast<uintmax_t>(max_mb) * 1024 * 1024;
            max_backup_files_ = backups;
            file_output_ = file_out;
            console_output_ = console;
            running_ = true;

            // 디렉토리 생성
            if (file_output_) {
                std::error_code ec;
                fs::create_directories(log_dir_, ec);
                if (ec) {
                    std::cerr << "Failed to create log directory: " << ec.message() << std::endl;
                    file_output_ = false;
                }
            }
        }

        void stop() {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }

        bool is_running() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return running_;
        }

        void write(const LogEntry& entry) {
            std::lock_guard<std::mutex> lock(mutex_);

            if (console_output_) {
                std::string console_line = format_log(entry, true);  // 콘솔용 (색상 있음)
                std::cerr << console_line << std::flush;
            }

            if (!file_output_) return;

            try {
                fs::path log_path = fs::path(log_dir_) / base_filename_;

                // 로테이션 체크
                if (max_file_size_ > 0 && fs::exists(log_path) && fs::file_size(log_path) >= max_file_size_) {
                    rotate_logs(log_path);
                }

                std::ofstream ofs(log_path, std::ios::app);
                if (ofs.is_open()) {
                    ofs << format_log(entry, false);  // 파일용 (색상 없음)
                }
            } catch (const std::exception& e) {
                if (console_output_) std::cerr << "Log write error: " << e.what() << std::endl;
            }
        }

    private:
        void rotate_logs(const fs::path& log_path) {
            // safe_print.log -> safe_print.log.1
            // safe_print.log.1 -> safe_print.log.2 ...
            if (max_backup_files_ <= 0) {
                fs::remove(log_path);
                return;
            }

            fs::path last_backup = fs::path(log_dir_) / (base_filename_ + "." + std::to_string(max_backup_files_));
            if (fs::exists(last_backup)) {
                fs::remove(last_backup);
            }

            for (int i = max_backup_files_ - 1; i >= 1; --i) {
                fs::path src = fs::path(log_dir_) / (base_filename_ + "." + std::to_string(i));
                fs::path dst = fs::path(log_dir_) / (base_filename_ + "." + std::to_string(i + 1));
                if (fs::exists(src)) {
                    fs::rename(src, dst);
                }
            }

            fs::path first_backup = fs::path(log_dir_) / (base_filename_ + ".1");
            fs::rename(log_path, first_backup);
        }

        static std::string format_log(const LogEntry& entry, bool use_color) {
            std::ostringstream oss;
            // 파일명만 추출
            std::string filename = fs::path(entry.file).filename().string();

            if (use_color) oss << level_color(entry.level);
            oss << "[" << entry.timestamp << "] [" << level_tag(entry.level) << "] [tid:" << entry.thread_id << "] "
                << "[" << entry.tag << "] [" << filename << ":" << entry.line << "] "
                << entry.message;
            if (use_color) oss << "\033[0m";
            oss << "\n";
            return oss.str();
        }

        std::string log_dir_;
        std::string base_filename_;
        uintmax_t max_file_size_ = 0;
        int max_backup_files_ = 0;
        bool file_output_ = false;
        bool console_output_ = true;

        mutable std::mutex mutex_;
        bool running_ = false;
    };

    void init_logger(const std::string& log_dir, const std::string& filename,
                     int max_size_mb, int max_files, bool file_out, bool console_out) {
        DiagLogger::instance().start(log_dir, filename, max_size_mb, max_files, file_out, console_out);
    }

    void shutdown_logger() {
        DiagLogger::instance().stop();
    }

    void logf(Lvl lvl, const char *tag, const char *file, int line, const char *fmt, ...) {
        if (lvl < g_current_level) return;

        // Format message
        va_list ap;
        va_start(ap, fmt);
        std::vector<char> buf(16 * 1024); // 16KB buffer
        std::vsnprintf(buf.data(), buf.size(), fmt, ap);
        va_end(ap);

        // Timestamp
        auto now = std::chrono::system_clock::now();
        std::time_t tt = std::chrono::system_clock::to_time_t(now);
        std::tm tm;
#if defined(_WIN32) || defined(_WIN64)
        localtime_s(&tm, &tt);
#else
        localtime_r(&tt, &tm);
#endif
        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

        // Thread ID
        std::stringstream ss_tid;
        ss_tid << std::this_thread::get_id();

        // 로거가 초기화되지 않았으면 stderr로 직접 출력 (Fallback)
        if (!DiagLogger::instance().is_running()) {
            fs::path p(file ? file : "-");
            std::string filename = p.filename().string();

            std::fprintf(stderr, "%s[%s] [%s] [tid:%s] [%s] [%s:%d] %s\033[0m\n",
                level_color(lvl), ts, level_tag(lvl), ss_tid.str().c_str(),
                tag ? tag : "-", filename.c_str(), line, buf.data());
            return;
        }

        LogEntry entry;
        entry.level = lvl;
        entry.timestamp = ts;
        entry.thread_id = ss_tid.str();
        entry.tag = tag ? tag : "-";
        entry.file = file ? file : "-";
        entry.line = line;
        entry.message = std::string(buf.data());

        DiagLogger::instance().write(entry);
    }

} // namespace safeprint
