#pragma once
/**
 * @file delta_compressor.h
 * @brief Adaptive compression of outgoing CRDT deltas
 *
 * The compressor picks a codec from the payload size and falls back to the
 * next-best available codec when the requested one is missing or fails:
 *
 *   fast       -> high-ratio -> none
 *   high-ratio -> fast       -> none
 *
 * Compression never fails outright; the algorithm actually applied is
 * recorded in the result and must be sent alongside the bytes.
 */

#include "crdtperf/optimize/compression_codec.h"
#include <nlohmann/json.hpp>
#include <array>
#include <memory>
#include <mutex>
#include <vector>

namespace crdtperf::optimize {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Delta compressor configuration
 */
struct CompressionConfig {
    UInt64 fast_threshold_bytes{1024};          ///< Smallest payload that gets compressed
    UInt64 high_ratio_threshold_bytes{10240};   ///< Smallest payload that gets high-ratio
    bool enable_fast{true};                     ///< Fast codec available
    bool enable_high_ratio{true};               ///< High-ratio codec available
    int fast_level{1};                          ///< zlib level of the fast codec (unused by LZ4)
    int high_ratio_level{9};                    ///< zlib level of the high-ratio codec
    UInt64 max_decoded_bytes{DEFAULT_MAX_DECODED_BYTES};

    /**
     * @brief Default configuration
     */
    static CompressionConfig default_config() noexcept {
        return CompressionConfig{};
    }

    /**
     * @brief Configuration with every codec disabled
     */
    static CompressionConfig uncompressed() noexcept {
        CompressionConfig config;
        config.enable_fast = false;
        config.enable_high_ratio = false;
        return config;
    }
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Outcome of one compression
 */
struct CompressionResult {
    UInt64 original_size{0};                    ///< Serialized payload size
    UInt64 compressed_size{0};                  ///< Size of `data`
    Real compression_ratio{1.0};                ///< original / compressed
    Real compression_time_ms{0.0};              ///< Codec wall time
    CompressionAlgorithm algorithm{CompressionAlgorithm::None};  ///< Algorithm applied
    CompressionAlgorithm requested{CompressionAlgorithm::None};  ///< Algorithm asked for
    std::vector<UInt8> data;                    ///< Bytes to transmit

    /**
     * @brief Whether a fallback codec was used
     */
    bool degraded() const noexcept { return algorithm != requested; }
};

/**
 * @brief Compressor statistics
 */
struct CompressionStats {
    std::array<UInt64, COMPRESSION_ALGORITHM_COUNT> compressions{};  ///< Indexed by algorithm
    UInt64 decompressions{0};
    UInt64 fallbacks{0};                        ///< Compressions that used another codec
    UInt64 codec_failures{0};                   ///< Codec errors, encode or decode
    UInt64 total_original_bytes{0};
    UInt64 total_compressed_bytes{0};

    UInt64 compressions_with(CompressionAlgorithm algorithm) const noexcept {
        return compressions[static_cast<SizeT>(algorithm)];
    }

    /**
     * @brief Overall ratio of all compressed payloads
     */
    Real overall_ratio() const noexcept {
        if (total_compressed_bytes == 0) return 1.0;
        return static_cast<Real>(total_original_bytes) / static_cast<Real>(total_compressed_bytes);
    }
};

// ============================================================================
// Delta Compressor
// ============================================================================

/**
 * @brief Codec registry with size-based selection and fallback
 *
 * Thread-safe. Codecs are invoked under the compressor lock since zlib
 * streams are created per call.
 */
class DeltaCompressor {
public:
    explicit DeltaCompressor(CompressionConfig config = CompressionConfig::default_config());
    ~DeltaCompressor();

    // Non-copyable
    DeltaCompressor(const DeltaCompressor&) = delete;
    DeltaCompressor& operator=(const DeltaCompressor&) = delete;

    /**
     * @brief Pick the algorithm for a payload size
     *
     * Below fast_threshold_bytes: none. Below high_ratio_threshold_bytes:
     * fast. Otherwise high-ratio.
     */
    CompressionAlgorithm select_algorithm(UInt64 payload_size) const noexcept;

    /**
     * @brief Serialize a delta and compress it
     * @param delta Delta payload
     * @param algorithm Requested algorithm
     * @param result Output, `result.algorithm` holds the algorithm applied
     * @return Success or SerializationFailed
     */
    Status compress(const nlohmann::json& delta, CompressionAlgorithm algorithm,
                    CompressionResult& result);

    /**
     * @brief Compress an already serialized delta
     */
    Status compress_bytes(const std::vector<UInt8>& payload, CompressionAlgorithm algorithm,
                          CompressionResult& result);

    /**
     * @brief Decompress and parse a delta
     * @return Success, CodecUnavailable, DecompressionFailed or DeserializationFailed
     */
    Status decompress(const std::vector<UInt8>& data, CompressionAlgorithm algorithm,
                      nlohmann::json& delta);

    /**
     * @brief Decompress to the serialized payload
     */
    Status decompress_bytes(const std::vector<UInt8>& data, CompressionAlgorithm algorithm,
                            std::vector<UInt8>& payload);

    /**
     * @brief Install a codec, replacing the one for the same algorithm
     */
    void register_codec(std::unique_ptr<ICompressionCodec> codec);

    /**
     * @brief Enable or disable a codec without removing it
     */
    void set_codec_enabled(CompressionAlgorithm algorithm, bool enabled);

    /**
     * @brief Check if a codec is installed and enabled (none is always available)
     */
    bool is_available(CompressionAlgorithm algorithm) const;

    /**
     * @brief Algorithm that compress() would apply for a request
     */
    CompressionAlgorithm resolve_algorithm(CompressionAlgorithm requested) const;

    /**
     * @brief Get statistics
     */
    CompressionStats get_statistics() const;

    /**
     * @brief Reset statistics
     */
    void reset_statistics();

    const CompressionConfig& config() const noexcept { return config_; }

private:
    bool is_available_locked(CompressionAlgorithm algorithm) const;
    std::array<CompressionAlgorithm, 3> fallback_chain(CompressionAlgorithm requested) const;

    CompressionConfig config_;
    mutable std::mutex mutex_;
    std::array<std::unique_ptr<ICompressionCodec>, COMPRESSION_ALGORITHM_COUNT> codecs_;
    std::array<bool, COMPRESSION_ALGORITHM_COUNT> enabled_{};
    CompressionStats stats_;
};

// ============================================================================
// Payload Helpers
// ============================================================================

/**
 * @brief Serialize a delta to UTF-8 JSON text bytes
 * @return Success or SerializationFailed (invalid UTF-8 in strings)
 */
Status serialize_delta(const nlohmann::json& delta, std::vector<UInt8>& bytes);

/**
 * @brief Parse UTF-8 JSON text bytes
 * @return Success or DeserializationFailed
 */
Status deserialize_delta(const std::vector<UInt8>& bytes, nlohmann::json& delta);

} // namespace crdtperf::optimize
