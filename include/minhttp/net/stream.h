#pragma once
#include <minhttp/net/error.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace minhttp::net {

// Duplex byte stream provided by a transport (TCP socket, TLS session, or
// an in-memory buffer). Closing happens in the destructor.
class Stream {
public:
    virtual ~Stream() = default;

    // Reads up to len bytes. Returns the number of bytes read, 0 on EOF,
    // std::nullopt on error (err describes it).
    virtual std::optional<size_t> read_some(uint8_t* buffer, size_t len,
                                            std::string& err) = 0;

    // Writes all len bytes or fails.
    virtual bool write_all(const uint8_t* data, size_t len, std::string& err) = 0;
};

// Stream over a fixed input buffer; everything written is captured.
class MemoryStream : public Stream {
public:
    MemoryStream() = default;
    explicit MemoryStream(std::string input);
    MemoryStream(std::string input, size_t max_chunk);

    std::optional<size_t> read_some(uint8_t* buffer, size_t len,
                                    std::string& err) override;
    bool write_all(const uint8_t* data, size_t len, std::string& err) override;

    const std::string& written() const { return written_; }
    size_t bytes_consumed() const { return pos_; }

private:
    std::string input_;
    size_t pos_ = 0;
    size_t max_chunk_ = 0;  // 0: unlimited
    std::string written_;
};

// Buffered reader that owns its stream. Nothing is read from the stream
// until a caller asks for bytes, so the buffer never runs ahead of the
// caller by more than one read_some() call.
class BufferedReader {
public:
    explicit BufferedReader(std::unique_ptr<Stream> stream);

    BufferedReader(const BufferedReader&) = delete;
    BufferedReader& operator=(const BufferedReader&) = delete;

    // Reads through the next '\n' (inclusive) into line. At end of stream
    // line holds whatever was left, possibly nothing. Fails on transport
    // errors and on lines longer than config::kMaxHeaderLineBytes.
    bool read_line(std::string& line, Error& err);

    // Returns buffered bytes first, then reads from the stream. 0 means EOF
    // or that the limit has been reached.
    std::optional<size_t> read(uint8_t* buffer, size_t len, Error& err);

    // Caps the bytes read() hands out from now on (Content-Length framing).
    void set_limit(size_t remaining) { limit_ = remaining; }

    // Bytes received from the stream but not yet handed out.
    size_t buffered() const { return buffer_.size() - pos_; }

private:
    bool fill(bool& eof, Error& err);

    std::unique_ptr<Stream> stream_;
    std::vector<uint8_t> buffer_;
    size_t pos_ = 0;
    std::optional<size_t> limit_;
};

} // namespace minhttp::net
