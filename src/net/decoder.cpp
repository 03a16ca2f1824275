#include <minhttp/net/decoder.h>
#include <minhttp/core/config.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <zlib.h>

namespace minhttp::net {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // anonymous namespace

const char* decoder_kind_name(Decoder::Kind kind) {
    switch (kind) {
        case Decoder::Kind::Identity: return "identity";
        case Decoder::Kind::Gzip:     return "gzip";
        case Decoder::Kind::Deflate:  return "deflate";
    }
    return "unknown";
}

void Decoder::ZStreamDeleter::operator()(z_stream_s* strm) const {
    inflateEnd(strm);
    delete strm;
}

Decoder::Decoder(Kind kind, std::unique_ptr<BufferedReader> source)
    : kind_(kind), source_(std::move(source)) {}

Decoder::Decoder(Decoder&&) noexcept = default;
Decoder& Decoder::operator=(Decoder&&) noexcept = default;
Decoder::~Decoder() = default;

Decoder Decoder::identity(std::unique_ptr<BufferedReader> source) {
    return Decoder(Kind::Identity, std::move(source));
}

Decoder Decoder::detect(HeaderMap& headers, std::unique_ptr<BufferedReader> source) {
    std::string header_name = "Content-Encoding";
    auto encoding = headers.get(header_name);
    if (!encoding.has_value()) {
        header_name = "Transfer-Encoding";
        encoding = headers.get(header_name);
    }

    const std::string value = encoding.has_value() ? trim(*encoding) : std::string();
    Kind kind = Kind::Identity;
    if (value == "gzip") {
        kind = Kind::Gzip;
    } else if (value == "deflate") {
        kind = Kind::Deflate;
    } else {
        return identity(std::move(source));
    }

    headers.remove(header_name);
    headers.remove("Content-Length");
    return Decoder(kind, std::move(source));
}

std::unique_ptr<BufferedReader> Decoder::release_source() && {
    return std::move(source_);
}

std::optional<size_t> Decoder::read(uint8_t* buffer, size_t len, Error& err) {
    started_ = true;
    switch (kind_) {
        case Kind::Identity:
            return source_->read(buffer, len, err);
        case Kind::Gzip:
        case Kind::Deflate:
            return inflate_some(buffer, len, err);
    }
    return std::nullopt;
}

std::optional<size_t> Decoder::inflate_some(uint8_t* buffer, size_t len, Error& err) {
    if (finished_ || len == 0) {
        return 0;
    }
    // zlib counts in uInt; a larger buffer is filled over several calls.
    len = std::min<size_t>(len, std::numeric_limits<uInt>::max());

    if (!zstream_) {
        std::unique_ptr<z_stream_s> strm(new z_stream_s{});
        // 15 + 16: gzip wrapper only. 15: zlib-wrapped deflate.
        const int window_bits = (kind_ == Kind::Gzip) ? 15 + 16 : 15;
        if (inflateInit2(strm.get(), window_bits) != Z_OK) {
            err.set(ErrorKind::Decompression, "inflateInit2() failed");
            return std::nullopt;
        }
        zstream_.reset(strm.release());
        input_.resize(core::config::kReadBufferSize);
    }

    z_stream_s* strm = zstream_.get();
    while (true) {
        if (strm->avail_in == 0 && !source_eof_) {
            auto n = source_->read(input_.data(), input_.size(), err);
            if (!n.has_value()) {
                return std::nullopt;
            }
            if (*n == 0) {
                source_eof_ = true;
                // An empty body is not a truncated stream.
                if (!received_input_) {
                    finished_ = true;
                    return 0;
                }
            }
            received_input_ = true;
            strm->next_in = input_.data();
            strm->avail_in = static_cast<uInt>(*n);
        }

        strm->next_out = buffer;
        strm->avail_out = static_cast<uInt>(len);
        const int ret = ::inflate(strm, Z_NO_FLUSH);
        const size_t produced = len - strm->avail_out;

        if (ret == Z_STREAM_END) {
            finished_ = true;
            return produced;
        }
        if (ret == Z_DATA_ERROR || ret == Z_NEED_DICT ||
            ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            std::string msg = std::string(decoder_kind_name(kind_)) + " data rejected";
            if (strm->msg != nullptr) {
                msg += ": ";
                msg += strm->msg;
            }
            err.set(ErrorKind::Decompression, msg);
            return std::nullopt;
        }

        if (produced > 0) {
            return produced;
        }
        if (source_eof_ && strm->avail_in == 0) {
            err.set(ErrorKind::Decompression,
                    std::string(decoder_kind_name(kind_)) + " stream truncated");
            return std::nullopt;
        }
    }
}

bool Decoder::read_to_string(std::string& out, Error& err) {
    uint8_t chunk[core::config::kReadBufferSize];
    while (true) {
        auto n = read(chunk, sizeof(chunk), err);
        if (!n.has_value()) {
            return false;
        }
        if (*n == 0) {
            return true;
        }
        out.append(reinterpret_cast<const char*>(chunk), *n);
    }
}

} // namespace minhttp::net
