#pragma once
#include "twosum/server.hpp"
#include "twosum/transport/stdio_transport.hpp"
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace twosum::test {

/// Read end of a pipe that already holds data and whose write end is closed.
/// data must fit in the pipe buffer (64 KiB on Linux).
inline int pipe_with_input(const std::string& data) {
    int fds[2];
    if (pipe(fds) < 0) {
        throw std::runtime_error("pipe failed");
    }
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fds[1], data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("write to pipe failed");
        }
        off += static_cast<size_t>(n);
    }
    ::close(fds[1]);
    return fds[0];
}

inline std::string read_all(int fd) {
    std::string out;
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("read from pipe failed");
        }
        if (n == 0) break;
        out.append(chunk, static_cast<size_t>(n));
    }
    return out;
}

/// Split newline-terminated output into parsed JSON records.
inline std::vector<nlohmann::json> parse_records(const std::string& raw) {
    std::vector<nlohmann::json> records;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t nl = raw.find('\n', pos);
        if (nl == std::string::npos) {
            throw std::runtime_error("unterminated output record");
        }
        records.push_back(nlohmann::json::parse(raw.substr(pos, nl - pos)));
        pos = nl + 1;
    }
    return records;
}

struct SessionRun {
    SessionStats stats;
    std::string raw_output;
    std::vector<nlohmann::json> responses;
};

/// Feed input to server.serve() over pipes and collect everything it wrote.
/// Input is written and output drained on their own threads, so neither
/// side is bounded by the pipe buffer.
inline SessionRun run_session(McpServer& server, const std::string& input,
                              StdioTransport::Options opts = StdioTransport::Options{}) {
    // The writer may outlive the read end when the session fails early
    std::signal(SIGPIPE, SIG_IGN);

    int in[2];
    int out[2];
    if (pipe(in) < 0) {
        throw std::runtime_error("pipe failed");
    }
    if (pipe(out) < 0) {
        ::close(in[0]);
        ::close(in[1]);
        throw std::runtime_error("pipe failed");
    }

    std::thread writer([&input, fd = in[1]]() {
        size_t off = 0;
        while (off < input.size()) {
            ssize_t n = ::write(fd, input.data() + off, input.size() - off);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            off += static_cast<size_t>(n);
        }
        ::close(fd);
    });

    SessionRun run;
    std::thread reader([&run, fd = out[0]]() {
        char chunk[4096];
        while (true) {
            ssize_t n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            run.raw_output.append(chunk, static_cast<size_t>(n));
        }
        ::close(fd);
    });

    try {
        // Destroying the transport closes in[0] and out[1], which ends both threads
        StdioTransport transport(in[0], out[1], opts);
        run.stats = server.serve(transport);
    } catch (...) {
        writer.join();
        reader.join();
        throw;
    }
    writer.join();
    reader.join();

    run.responses = parse_records(run.raw_output);
    return run;
}

} // namespace twosum::test
