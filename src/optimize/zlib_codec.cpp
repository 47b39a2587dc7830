/**
 * @file zlib_codec.cpp
 * @brief zlib and gzip implementations of ICompressionCodec
 */

#include "crdtperf/optimize/compression_codec.h"
#include "crdtperf/core/logging.h"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace crdtperf::optimize {

// ============================================================================
// Algorithm Names
// ============================================================================

const char* compression_algorithm_to_string(CompressionAlgorithm algorithm) {
    switch (algorithm) {
        case CompressionAlgorithm::None: return "none";
        case CompressionAlgorithm::Fast: return "fast";
        case CompressionAlgorithm::HighRatio: return "high-ratio";
        default: return "unknown";
    }
}

std::optional<CompressionAlgorithm> parse_compression_algorithm(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none") return CompressionAlgorithm::None;
    if (lower == "fast" || lower == "lz4") return CompressionAlgorithm::Fast;
    if (lower == "high-ratio" || lower == "high_ratio" || lower == "gzip") {
        return CompressionAlgorithm::HighRatio;
    }
    return std::nullopt;
}

namespace {

constexpr int ZLIB_WINDOW_BITS = 15;
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int AUTO_DETECT_WINDOW_BITS = 15 + 32;
constexpr SizeT CHUNK_SIZE = 16 * 1024;

// ============================================================================
// Zlib Codec
// ============================================================================

class ZlibCodec : public ICompressionCodec {
public:
    ZlibCodec(CompressionAlgorithm algorithm, int level, int window_bits,
              UInt64 max_decoded_bytes)
        : algorithm_(algorithm)
        , level_(level)
        , window_bits_(window_bits)
        , max_decoded_bytes_(max_decoded_bytes) {}

    CompressionAlgorithm algorithm() const override { return algorithm_; }

    Status encode(const std::vector<UInt8>& input, std::vector<UInt8>& output) override {
        output.clear();

        z_stream stream{};
        if (deflateInit2(&stream, level_, Z_DEFLATED, window_bits_, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            log_->error("deflateInit2 failed for {}", compression_algorithm_to_string(algorithm_));
            return Status::CompressionFailed;
        }

        output.resize(deflateBound(&stream, static_cast<uLong>(input.size())));
        stream.next_in = const_cast<Bytef*>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());
        stream.next_out = output.data();
        stream.avail_out = static_cast<uInt>(output.size());

        const int rc = deflate(&stream, Z_FINISH);
        const uLong produced = stream.total_out;
        deflateEnd(&stream);

        if (rc != Z_STREAM_END) {
            log_->error("deflate failed ({}) for {}", rc, compression_algorithm_to_string(algorithm_));
            output.clear();
            return Status::CompressionFailed;
        }

        output.resize(produced);
        return Status::Success;
    }

    Status decode(const std::vector<UInt8>& input, std::vector<UInt8>& output) override {
        output.clear();

        z_stream stream{};
        if (inflateInit2(&stream, AUTO_DETECT_WINDOW_BITS) != Z_OK) {
            log_->error("inflateInit2 failed");
            return Status::DecompressionFailed;
        }

        stream.next_in = const_cast<Bytef*>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());

        UInt8 chunk[CHUNK_SIZE];
        int rc = Z_OK;
        while (rc != Z_STREAM_END) {
            stream.next_out = chunk;
            stream.avail_out = static_cast<uInt>(CHUNK_SIZE);

            rc = inflate(&stream, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END) {
                break;
            }

            const SizeT produced = CHUNK_SIZE - stream.avail_out;
            if (output.size() + produced > max_decoded_bytes_) {
                rc = Z_MEM_ERROR;
                break;
            }
            output.insert(output.end(), chunk, chunk + produced);

            if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
                rc = Z_BUF_ERROR;   // truncated stream
                break;
            }
        }
        inflateEnd(&stream);

        if (rc != Z_STREAM_END) {
            log_->warn("inflate failed ({}) for {}", rc, compression_algorithm_to_string(algorithm_));
            output.clear();
            return Status::DecompressionFailed;
        }
        return Status::Success;
    }

private:
    CompressionAlgorithm algorithm_;
    int level_;
    int window_bits_;
    UInt64 max_decoded_bytes_;
    std::shared_ptr<spdlog::logger> log_{core::logging::get_logger("codec")};
};

} // anonymous namespace

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<ICompressionCodec> create_zlib_fast_codec(int level, UInt64 max_decoded_bytes) {
    return std::make_unique<ZlibCodec>(CompressionAlgorithm::Fast,
                                       std::clamp(level, 1, 9),
                                       ZLIB_WINDOW_BITS, max_decoded_bytes);
}

std::unique_ptr<ICompressionCodec> create_fast_codec(int level, UInt64 max_decoded_bytes) {
#ifdef CRDTPERF_WITH_LZ4
    return create_lz4_codec(create_zlib_fast_codec(level, max_decoded_bytes), max_decoded_bytes);
#else
    return create_zlib_fast_codec(level, max_decoded_bytes);
#endif
}

std::unique_ptr<ICompressionCodec> create_high_ratio_codec(int level, UInt64 max_decoded_bytes) {
    return std::make_unique<ZlibCodec>(CompressionAlgorithm::HighRatio,
                                       std::clamp(level, 1, 9),
                                       GZIP_WINDOW_BITS, max_decoded_bytes);
}

} // namespace crdtperf::optimize
