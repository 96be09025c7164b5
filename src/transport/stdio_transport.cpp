#include "twosum/transport/stdio_transport.hpp"
#include "twosum/error.hpp"
#include "twosum/log.hpp"
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace twosum {

namespace {

void strip_cr(std::string& line) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(Options{}) {
}

StdioTransport::StdioTransport(Options opts)
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false), opts_(opts) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true), opts_(opts) {
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
}

std::optional<std::string> StdioTransport::read_message() {
    while (true) {
        size_t nl = buffer_.find('\n', std::max(pos_, scan_pos_));
        if (nl != std::string::npos) {
            if (nl - pos_ > opts_.max_line_bytes) {
                connected_ = false;
                throw McpTransportError("Record exceeds " + std::to_string(opts_.max_line_bytes)
                                        + " bytes");
            }
            std::string line = buffer_.substr(pos_, nl - pos_);
            pos_ = nl + 1;
            scan_pos_ = pos_;

            strip_cr(line);
            if (line.empty()) continue;
            return line;
        }
        scan_pos_ = buffer_.size();
        check_pending_size();

        if (eof_) {
            connected_ = false;
            if (pos_ >= buffer_.size()) return std::nullopt;

            // Final record without a terminator
            std::string line = buffer_.substr(pos_);
            buffer_.clear();
            pos_ = scan_pos_ = 0;
            strip_cr(line);
            if (line.empty()) return std::nullopt;
            return line;
        }

        if (!fill_buffer()) {
            logger()->debug("End of input stream");
            eof_ = true;
        }
    }
}

void StdioTransport::check_pending_size() {
    if (buffer_.size() - pos_ > opts_.max_line_bytes) {
        connected_ = false;
        throw McpTransportError("Record exceeds " + std::to_string(opts_.max_line_bytes)
                                + " bytes");
    }
}

bool StdioTransport::fill_buffer() {
    // Drop consumed records before growing the buffer
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        scan_pos_ -= pos_;
        pos_ = 0;
    }

    char chunk[4096];
    while (true) {
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) {
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }
}

void StdioTransport::send(std::string_view record) {
    std::string framed;
    framed.reserve(record.size() + 1);
    framed.append(record);
    framed += '\n';

    const char* data = framed.data();
    size_t remaining = framed.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace twosum
