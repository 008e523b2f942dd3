#include "safeprint/console_writer.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include "safeprint/errors.hpp"
#include "sp_log.hpp"

namespace safeprint {

void ConsoleWriter::write_line(std::string_view line) const
{
    if (raw_) {
        errno = 0;
        const std::size_t written = std::fwrite(line.data(), 1, line.size(), raw_);
        const bool ok = written == line.size() && std::fputc('\n', raw_) != EOF && std::fflush(raw_) == 0;
        if (!ok) {
            const std::string reason = errno ? std::strerror(errno) : "short write";
            std::clearerr(raw_);
            SP_LOG_DBG("Console", "raw console write failed: %s", reason.c_str());
            throw IoError("console write failed: " + reason);
        }
        return;
    }

    if (!text_) {
        throw IoError("console write failed: no output stream");
    }
    // 텍스트 모드 폴백 (캡처된 스트림 등)
    text_->write(line.data(), static_cast<std::streamsize>(line.size()));
    text_->put('\n');
    text_->flush();
    if (!*text_) {
        SP_LOG_DBG("Console", "text console write failed");
        throw IoError("console write failed: output stream is in a failed state");
    }
}

} // namespace safeprint
