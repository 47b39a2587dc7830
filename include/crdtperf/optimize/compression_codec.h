#pragma once
/**
 * @file compression_codec.h
 * @brief Pluggable compression codecs used by the delta compressor
 *
 * Two real codecs are provided:
 * - fast: LZ4 frames when built with CRDTPERF_WITH_LZ4, otherwise a zlib
 *   stream at Z_BEST_SPEED
 * - high-ratio: gzip stream at Z_BEST_COMPRESSION
 *
 * The zlib decoders accept either zlib stream format, and the LZ4 decoder
 * hands anything that is not an LZ4 frame to the zlib fast codec.
 */

#include "crdtperf/core/types.h"
#include "crdtperf/core/status.h"
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace crdtperf::optimize {

// ============================================================================
// Compression Algorithm
// ============================================================================

/**
 * @brief Compression algorithms, ordered by cost
 */
enum class CompressionAlgorithm : UInt8 {
    None = 0,       ///< Payload sent as is
    Fast,           ///< Low latency codec
    HighRatio       ///< Best ratio codec
};

/// Number of CompressionAlgorithm values
inline constexpr SizeT COMPRESSION_ALGORITHM_COUNT = 3;

/**
 * @brief Convert CompressionAlgorithm to its wire name ("none", "fast", "high-ratio")
 */
const char* compression_algorithm_to_string(CompressionAlgorithm algorithm);

/**
 * @brief Parse a wire name back to CompressionAlgorithm
 */
std::optional<CompressionAlgorithm> parse_compression_algorithm(std::string_view name);

// ============================================================================
// Codec Interface
// ============================================================================

/**
 * @brief Byte-level compression codec
 */
class ICompressionCodec {
public:
    virtual ~ICompressionCodec() = default;

    /**
     * @brief Algorithm implemented by this codec
     */
    virtual CompressionAlgorithm algorithm() const = 0;

    /**
     * @brief Compress a buffer
     * @param input Raw bytes
     * @param output Compressed bytes
     * @return Success or CompressionFailed
     */
    virtual Status encode(const std::vector<UInt8>& input, std::vector<UInt8>& output) = 0;

    /**
     * @brief Decompress a buffer
     * @param input Compressed bytes
     * @param output Raw bytes
     * @return Success or DecompressionFailed
     */
    virtual Status decode(const std::vector<UInt8>& input, std::vector<UInt8>& output) = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

/// Upper bound on decoded size, guards against decompression bombs
inline constexpr UInt64 DEFAULT_MAX_DECODED_BYTES = 256ULL * 1024 * 1024;

/**
 * @brief Create the codec for CompressionAlgorithm::Fast
 * @param level zlib level, used when the zlib codec encodes
 */
std::unique_ptr<ICompressionCodec> create_fast_codec(
    int level = 1, UInt64 max_decoded_bytes = DEFAULT_MAX_DECODED_BYTES);

/**
 * @brief Create the zlib stream codec for CompressionAlgorithm::Fast
 */
std::unique_ptr<ICompressionCodec> create_zlib_fast_codec(
    int level = 1, UInt64 max_decoded_bytes = DEFAULT_MAX_DECODED_BYTES);

#ifdef CRDTPERF_WITH_LZ4
/**
 * @brief Create the LZ4 frame codec for CompressionAlgorithm::Fast
 * @param fallback Decoder for payloads that are not LZ4 frames
 */
std::unique_ptr<ICompressionCodec> create_lz4_codec(
    std::unique_ptr<ICompressionCodec> fallback,
    UInt64 max_decoded_bytes = DEFAULT_MAX_DECODED_BYTES);
#endif

/**
 * @brief Create the gzip codec for CompressionAlgorithm::HighRatio
 */
std::unique_ptr<ICompressionCodec> create_high_ratio_codec(
    int level = 9, UInt64 max_decoded_bytes = DEFAULT_MAX_DECODED_BYTES);

} // namespace crdtperf::optimize
