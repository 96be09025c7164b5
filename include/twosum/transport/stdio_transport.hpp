#pragma once
#include "transport.hpp"
#include <cstddef>
#include <string>

namespace twosum {

constexpr std::size_t DEFAULT_MAX_LINE_BYTES = 10 * 1024 * 1024;

/// StdioTransport reads newline-delimited records from stdin and writes
/// them to stdout. Reads and writes block the calling thread.
class StdioTransport : public ITransport {
public:
    struct Options {
        /// Longest accepted record, terminator excluded. A longer record is a
        /// fatal stream error, not a per-record one.
        std::size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES;
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport over the given descriptors, which it then owns
    /// and closes (for testing).
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    std::optional<std::string> read_message() override;
    void send(std::string_view record) override;
    bool is_connected() const override;

private:
    bool fill_buffer();
    void check_pending_size();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    Options opts_;

    std::string buffer_;
    std::size_t pos_{0};       // start of the first unconsumed record
    std::size_t scan_pos_{0};  // buffer_ before this offset holds no '\n' after pos_
    bool eof_{false};
    bool connected_{true};
};

} // namespace twosum
