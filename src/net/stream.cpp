#include <minhttp/net/stream.h>
#include <minhttp/core/config.h>

#include <algorithm>
#include <cstring>

namespace minhttp::net {

// ===========================================================================
// MemoryStream
// ===========================================================================

MemoryStream::MemoryStream(std::string input)
    : input_(std::move(input)) {}

MemoryStream::MemoryStream(std::string input, size_t max_chunk)
    : input_(std::move(input)), max_chunk_(max_chunk) {}

std::optional<size_t> MemoryStream::read_some(uint8_t* buffer, size_t len,
                                              std::string& /*err*/) {
    size_t n = std::min(len, input_.size() - pos_);
    if (max_chunk_ > 0) {
        n = std::min(n, max_chunk_);
    }
    if (n > 0) {
        std::memcpy(buffer, input_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

bool MemoryStream::write_all(const uint8_t* data, size_t len, std::string& /*err*/) {
    written_.append(reinterpret_cast<const char*>(data), len);
    return true;
}

// ===========================================================================
// BufferedReader
// ===========================================================================

BufferedReader::BufferedReader(std::unique_ptr<Stream> stream)
    : stream_(std::move(stream)) {}

bool BufferedReader::fill(bool& eof, Error& err) {
    if (pos_ > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(pos_));
        pos_ = 0;
    }

    uint8_t chunk[core::config::kReadBufferSize];
    std::string io_err;
    auto n = stream_->read_some(chunk, sizeof(chunk), io_err);
    if (!n.has_value()) {
        err.set(ErrorKind::Transport, io_err);
        return false;
    }

    eof = (*n == 0);
    buffer_.insert(buffer_.end(), chunk, chunk + *n);
    return true;
}

bool BufferedReader::read_line(std::string& line, Error& err) {
    line.clear();
    size_t scanned = pos_;
    while (true) {
        auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(scanned);
        auto nl = std::find(begin, buffer_.end(), static_cast<uint8_t>('\n'));
        if (nl != buffer_.end()) {
            auto line_begin = buffer_.begin() + static_cast<std::ptrdiff_t>(pos_);
            line.assign(line_begin, nl + 1);
            pos_ = static_cast<size_t>(nl - buffer_.begin()) + 1;
            return true;
        }

        if (buffered() > core::config::kMaxHeaderLineBytes) {
            err.set(ErrorKind::MalformedResponse, "Response line exceeds maximum length");
            return false;
        }

        const size_t pending = buffered();
        bool eof = false;
        if (!fill(eof, err)) {
            return false;
        }
        // fill() compacts the buffer, so resume the scan relative to pos_ == 0
        scanned = pending;
        if (eof) {
            line.assign(buffer_.begin(), buffer_.end());
            buffer_.clear();
            pos_ = 0;
            return true;
        }
    }
}

std::optional<size_t> BufferedReader::read(uint8_t* buffer, size_t len, Error& err) {
    if (limit_.has_value()) {
        len = std::min(len, *limit_);
    }
    if (len == 0) {
        return 0;
    }

    if (buffered() > 0) {
        size_t n = std::min(len, buffered());
        std::memcpy(buffer, buffer_.data() + pos_, n);
        pos_ += n;
        if (limit_.has_value()) {
            *limit_ -= n;
        }
        return n;
    }

    std::string io_err;
    auto n = stream_->read_some(buffer, len, io_err);
    if (!n.has_value()) {
        err.set(ErrorKind::Transport, io_err);
        return std::nullopt;
    }
    if (limit_.has_value()) {
        *limit_ -= *n;
    }
    return n;
}

} // namespace minhttp::net
