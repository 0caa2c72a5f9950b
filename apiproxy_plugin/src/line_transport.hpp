#pragma once

#include <chrono>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace apiproxy::transport {

// Longest line accepted from a descriptor before the stream is treated as broken.
constexpr std::size_t kMaxLineBytes = 16u * 1024u * 1024u;

/**
 * Duplex line channel. One message per line; every write is flushed before
 * returning because the peer blocks on each reply.
 */
class LineTransport {
public:
    virtual ~LineTransport() = default;

    /// Blocks for the next line (without its terminator). Returns false at end of stream.
    virtual bool read_line(std::string& line) = 0;

    /// Writes `line`, appending '\n' when missing, then flushes.
    virtual bool write_line(const std::string& line) = 0;

    /// True when the last line read was longer than the transport accepts and was cut short.
    virtual bool line_truncated() const { return false; }
};

/// std::istream/std::ostream backed transport: stdin/stdout in production, string streams in tests.
/// A line longer than `max_line_bytes` is consumed whole but only its prefix is kept.
class StreamLineTransport final : public LineTransport {
public:
    StreamLineTransport(std::istream& in, std::ostream& out, std::size_t max_line_bytes = kMaxLineBytes);

    bool read_line(std::string& line) override;
    bool write_line(const std::string& line) override;
    bool line_truncated() const override { return truncated_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::size_t max_line_bytes_;
    bool truncated_ = false;
};

enum class ReadStatus {
    Line,
    Eof,
    Timeout,
    Error,
};

const char* to_string(ReadStatus status);

/// Raw file-descriptor transport, used on both ends of a plugin pipe.
class FdLineTransport final : public LineTransport {
public:
    FdLineTransport(int read_fd, int write_fd);

    bool read_line(std::string& line) override;
    bool write_line(const std::string& line) override;

    /// Waits at most `timeout` for a complete line.
    ReadStatus read_line_for(std::string& line, std::chrono::milliseconds timeout);

    int read_fd() const { return read_fd_; }
    int write_fd() const { return write_fd_; }

private:
    bool take_buffered_line(std::string& line);
    ReadStatus fill_buffer(int timeout_ms);

    int read_fd_;
    int write_fd_;
    std::string buffer_;
};

} // namespace apiproxy::transport
