#include "line_transport.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <ios>
#include <streambuf>
#include <string>

namespace apiproxy::transport {

StreamLineTransport::StreamLineTransport(std::istream& in, std::ostream& out, std::size_t max_line_bytes)
    : in_(in), out_(out), max_line_bytes_(max_line_bytes) {}

bool StreamLineTransport::read_line(std::string& line) {
    line.clear();
    truncated_ = false;

    std::streambuf* buf = in_.rdbuf();
    if (!in_.good() || !buf) {
        return false;
    }

    auto append = [&](char c) {
        if (line.size() < max_line_bytes_) {
            line.push_back(c);
        } else {
            truncated_ = true;
        }
    };

    bool got_any = false;
    bool pending_cr = false; // a '\r' directly before the terminator is not part of the line
    while (true) {
        int c = buf->sbumpc();
        if (std::char_traits<char>::eq_int_type(c, std::char_traits<char>::eof())) {
            in_.setstate(std::ios::eofbit);
            if (!got_any) {
                return false;
            }
            break;
        }
        got_any = true;
        if (c == '\n') {
            break;
        }
        if (pending_cr) {
            append('\r');
            pending_cr = false;
        }
        if (c == '\r') {
            pending_cr = true;
            continue;
        }
        append(std::char_traits<char>::to_char_type(c));
    }
    return true;
}

bool StreamLineTransport::write_line(const std::string& line) {
    out_ << line;
    if (line.empty() || line.back() != '\n') {
        out_ << '\n';
    }
    out_.flush();
    return static_cast<bool>(out_);
}

const char* to_string(ReadStatus status) {
    switch (status) {
        case ReadStatus::Line:
            return "line";
        case ReadStatus::Eof:
            return "eof";
        case ReadStatus::Timeout:
            return "timeout";
        case ReadStatus::Error:
            return "error";
    }
    return "unknown";
}

FdLineTransport::FdLineTransport(int read_fd, int write_fd) : read_fd_(read_fd), write_fd_(write_fd) {}

bool FdLineTransport::take_buffered_line(std::string& line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        return false;
    }
    line.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

ReadStatus FdLineTransport::fill_buffer(int timeout_ms) {
    if (timeout_ms >= 0) {
        pollfd pfd{};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, timeout_ms);
        } while (ready < 0 && errno == EINTR);
        if (ready < 0) {
            return ReadStatus::Error;
        }
        if (ready == 0) {
            return ReadStatus::Timeout;
        }
    }

    char chunk[4096];
    ssize_t n = 0;
    do {
        n = ::read(read_fd_, chunk, sizeof(chunk));
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        return ReadStatus::Error;
    }
    if (n == 0) {
        return ReadStatus::Eof;
    }
    buffer_.append(chunk, static_cast<size_t>(n));
    if (buffer_.size() > kMaxLineBytes && buffer_.find('\n') == std::string::npos) {
        return ReadStatus::Error;
    }
    return ReadStatus::Line;
}

bool FdLineTransport::read_line(std::string& line) {
    while (!take_buffered_line(line)) {
        if (fill_buffer(-1) != ReadStatus::Line) {
            return false;
        }
    }
    return true;
}

ReadStatus FdLineTransport::read_line_for(std::string& line, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!take_buffered_line(line)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ReadStatus::Timeout;
        }
        ReadStatus status = fill_buffer(static_cast<int>(remaining.count()));
        if (status != ReadStatus::Line) {
            return status;
        }
    }
    return ReadStatus::Line;
}

bool FdLineTransport::write_line(const std::string& line) {
    std::string data = line;
    if (data.empty() || data.back() != '\n') {
        data.push_back('\n');
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(write_fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

} // namespace apiproxy::transport
