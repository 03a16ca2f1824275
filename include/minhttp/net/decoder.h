#pragma once
#include <minhttp/net/error.h>
#include <minhttp/net/header_map.h>
#include <minhttp/net/stream.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct z_stream_s;

namespace minhttp::net {

// Response body reader. The variant is fixed at construction, before any
// body byte has been read; read() then dispatches on it.
class Decoder {
public:
    enum class Kind { Identity, Gzip, Deflate };

    // Picks the variant from Content-Encoding, falling back to
    // Transfer-Encoding (trimmed, case-sensitive "gzip" or "deflate"). On a
    // match the consulted encoding header and Content-Length are removed
    // from headers.
    static Decoder detect(HeaderMap& headers, std::unique_ptr<BufferedReader> source);
    static Decoder identity(std::unique_ptr<BufferedReader> source);

    Decoder(Decoder&&) noexcept;
    Decoder& operator=(Decoder&&) noexcept;
    ~Decoder();

    // Returns bytes produced, 0 at end of body, std::nullopt on error.
    // Corrupt compressed data is reported as ErrorKind::Decompression.
    std::optional<size_t> read(uint8_t* buffer, size_t len, Error& err);

    // Reads until end of body, appending to out.
    bool read_to_string(std::string& out, Error& err);

    Kind kind() const { return kind_; }

    // True once read() has been called.
    bool started() const { return started_; }

    // Hands back the wrapped source so a different variant can be chosen.
    // Only meaningful before the first read().
    std::unique_ptr<BufferedReader> release_source() &&;

private:
    struct ZStreamDeleter {
        void operator()(z_stream_s* strm) const;
    };

    Decoder(Kind kind, std::unique_ptr<BufferedReader> source);

    std::optional<size_t> inflate_some(uint8_t* buffer, size_t len, Error& err);

    Kind kind_ = Kind::Identity;
    std::unique_ptr<BufferedReader> source_;
    // Heap-allocated: zlib keeps a back pointer to the z_stream.
    std::unique_ptr<z_stream_s, ZStreamDeleter> zstream_;
    std::vector<uint8_t> input_;
    bool source_eof_ = false;
    bool received_input_ = false;
    bool finished_ = false;
    bool started_ = false;
};

const char* decoder_kind_name(Decoder::Kind kind);

} // namespace minhttp::net
