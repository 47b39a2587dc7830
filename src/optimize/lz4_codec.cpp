/**
 * @file lz4_codec.cpp
 * @brief LZ4 frame implementation of ICompressionCodec
 */

#include "crdtperf/optimize/compression_codec.h"
#include "crdtperf/core/logging.h"
#include <lz4frame.h>
#include <cstring>

namespace crdtperf::optimize {

namespace {

constexpr UInt8 LZ4_FRAME_MAGIC[4] = {0x04, 0x22, 0x4D, 0x18};
constexpr SizeT CHUNK_SIZE = 64 * 1024;

bool is_lz4_frame(const std::vector<UInt8>& input) {
    return input.size() >= sizeof(LZ4_FRAME_MAGIC) &&
           std::memcmp(input.data(), LZ4_FRAME_MAGIC, sizeof(LZ4_FRAME_MAGIC)) == 0;
}

// ============================================================================
// LZ4 Codec
// ============================================================================

class Lz4Codec : public ICompressionCodec {
public:
    Lz4Codec(std::unique_ptr<ICompressionCodec> fallback, UInt64 max_decoded_bytes)
        : fallback_(std::move(fallback))
        , max_decoded_bytes_(max_decoded_bytes) {}

    CompressionAlgorithm algorithm() const override {
        return CompressionAlgorithm::Fast;
    }

    Status encode(const std::vector<UInt8>& input, std::vector<UInt8>& output) override {
        LZ4F_preferences_t prefs;
        std::memset(&prefs, 0, sizeof(prefs));
        prefs.frameInfo.contentSize = input.size();

        output.resize(LZ4F_compressFrameBound(input.size(), &prefs));
        const size_t written = LZ4F_compressFrame(output.data(), output.size(),
                                                  input.data(), input.size(), &prefs);
        if (LZ4F_isError(written)) {
            log_->warn("LZ4 compression failed: {}", LZ4F_getErrorName(written));
            output.clear();
            return Status::CompressionFailed;
        }
        output.resize(written);
        return Status::Success;
    }

    Status decode(const std::vector<UInt8>& input, std::vector<UInt8>& output) override {
        // zlib streams from peers built without LZ4
        if (!is_lz4_frame(input)) {
            if (!fallback_) {
                return Status::DecompressionFailed;
            }
            return fallback_->decode(input, output);
        }

        LZ4F_dctx* raw = nullptr;
        const size_t created = LZ4F_createDecompressionContext(&raw, LZ4F_VERSION);
        if (LZ4F_isError(created)) {
            log_->error("LZ4 context creation failed: {}", LZ4F_getErrorName(created));
            return Status::DecompressionFailed;
        }
        std::unique_ptr<LZ4F_dctx, decltype(&LZ4F_freeDecompressionContext)> dctx(
            raw, &LZ4F_freeDecompressionContext);

        output.clear();
        std::vector<UInt8> chunk(CHUNK_SIZE);
        const UInt8* src = input.data();
        size_t remaining = input.size();

        size_t hint = 1;
        while (hint != 0) {
            size_t dst_size = chunk.size();
            size_t src_size = remaining;
            hint = LZ4F_decompress(dctx.get(), chunk.data(), &dst_size, src, &src_size, nullptr);
            if (LZ4F_isError(hint)) {
                log_->warn("LZ4 decompression failed: {}", LZ4F_getErrorName(hint));
                output.clear();
                return Status::DecompressionFailed;
            }

            output.insert(output.end(), chunk.begin(), chunk.begin() + dst_size);
            if (output.size() > max_decoded_bytes_) {
                log_->warn("LZ4 payload exceeds {} decoded bytes", max_decoded_bytes_);
                output.clear();
                return Status::DecompressionFailed;
            }

            src += src_size;
            remaining -= src_size;
            if (hint != 0 && src_size == 0 && dst_size == 0) {
                log_->warn("LZ4 frame truncated");
                output.clear();
                return Status::DecompressionFailed;
            }
        }
        return Status::Success;
    }

private:
    std::unique_ptr<ICompressionCodec> fallback_;
    UInt64 max_decoded_bytes_;
    std::shared_ptr<spdlog::logger> log_{core::logging::get_logger("codec")};
};

} // anonymous namespace

std::unique_ptr<ICompressionCodec> create_lz4_codec(std::unique_ptr<ICompressionCodec> fallback,
                                                    UInt64 max_decoded_bytes) {
    return std::make_unique<Lz4Codec>(std::move(fallback), max_decoded_bytes);
}

} // namespace crdtperf::optimize
