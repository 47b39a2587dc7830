/**
 * @file delta_compressor.cpp
 * @brief Delta compressor implementation
 */

#include "crdtperf/optimize/delta_compressor.h"
#include "crdtperf/core/logging.h"

namespace crdtperf::optimize {

namespace {

SizeT index_of(CompressionAlgorithm algorithm) {
    return static_cast<SizeT>(algorithm);
}

std::shared_ptr<spdlog::logger> logger() {
    return core::logging::get_logger("compressor");
}

} // anonymous namespace

// ============================================================================
// Payload Helpers
// ============================================================================

Status serialize_delta(const nlohmann::json& delta, std::vector<UInt8>& bytes) {
    try {
        const std::string text = delta.dump();
        bytes.assign(text.begin(), text.end());
        return Status::Success;
    } catch (const nlohmann::json::exception& e) {
        logger()->error("Delta serialization failed: {}", e.what());
        bytes.clear();
        return Status::SerializationFailed;
    }
}

Status deserialize_delta(const std::vector<UInt8>& bytes, nlohmann::json& delta) {
    try {
        delta = nlohmann::json::parse(bytes.begin(), bytes.end());
        return Status::Success;
    } catch (const nlohmann::json::exception& e) {
        logger()->warn("Delta parse failed: {}", e.what());
        return Status::DeserializationFailed;
    }
}

// ============================================================================
// DeltaCompressor
// ============================================================================

DeltaCompressor::DeltaCompressor(CompressionConfig config)
    : config_(config) {
    codecs_[index_of(CompressionAlgorithm::Fast)] =
        create_fast_codec(config_.fast_level, config_.max_decoded_bytes);
    codecs_[index_of(CompressionAlgorithm::HighRatio)] =
        create_high_ratio_codec(config_.high_ratio_level, config_.max_decoded_bytes);

    enabled_[index_of(CompressionAlgorithm::None)] = true;
    enabled_[index_of(CompressionAlgorithm::Fast)] = config_.enable_fast;
    enabled_[index_of(CompressionAlgorithm::HighRatio)] = config_.enable_high_ratio;
}

DeltaCompressor::~DeltaCompressor() = default;

CompressionAlgorithm DeltaCompressor::select_algorithm(UInt64 payload_size) const noexcept {
    if (payload_size < config_.fast_threshold_bytes) {
        return CompressionAlgorithm::None;
    }
    if (payload_size < config_.high_ratio_threshold_bytes) {
        return CompressionAlgorithm::Fast;
    }
    return CompressionAlgorithm::HighRatio;
}

Status DeltaCompressor::compress(const nlohmann::json& delta, CompressionAlgorithm algorithm,
                                 CompressionResult& result) {
    std::vector<UInt8> payload;
    Status status = serialize_delta(delta, payload);
    if (!succeeded(status)) {
        return status;
    }
    return compress_bytes(payload, algorithm, result);
}

Status DeltaCompressor::compress_bytes(const std::vector<UInt8>& payload,
                                       CompressionAlgorithm algorithm,
                                       CompressionResult& result) {
    result = CompressionResult{};
    result.requested = algorithm;
    result.original_size = static_cast<UInt64>(payload.size());

    std::lock_guard<std::mutex> lock(mutex_);

    for (CompressionAlgorithm candidate : fallback_chain(algorithm)) {
        if (!is_available_locked(candidate)) {
            continue;
        }

        if (candidate == CompressionAlgorithm::None) {
            result.data = payload;
            result.algorithm = CompressionAlgorithm::None;
            break;
        }

        const auto start = SteadyClock::now();
        std::vector<UInt8> encoded;
        Status status = codecs_[index_of(candidate)]->encode(payload, encoded);
        result.compression_time_ms = to_milliseconds(SteadyClock::now() - start);

        if (succeeded(status)) {
            result.data = std::move(encoded);
            result.algorithm = candidate;
            break;
        }

        ++stats_.codec_failures;
        logger()->warn("Codec {} failed ({}), trying next",
                       compression_algorithm_to_string(candidate), status_to_string(status));
    }

    result.compressed_size = static_cast<UInt64>(result.data.size());
    if (result.algorithm == CompressionAlgorithm::None || result.compressed_size == 0) {
        result.compression_ratio = 1.0;
    } else {
        result.compression_ratio = static_cast<Real>(result.original_size) /
                                   static_cast<Real>(result.compressed_size);
    }

    if (result.degraded()) {
        ++stats_.fallbacks;
        logger()->debug("Requested {} but applied {}",
                        compression_algorithm_to_string(result.requested),
                        compression_algorithm_to_string(result.algorithm));
    }
    ++stats_.compressions[index_of(result.algorithm)];
    stats_.total_original_bytes += result.original_size;
    stats_.total_compressed_bytes += result.compressed_size;

    return Status::Success;
}

Status DeltaCompressor::decompress(const std::vector<UInt8>& data, CompressionAlgorithm algorithm,
                                   nlohmann::json& delta) {
    std::vector<UInt8> payload;
    Status status = decompress_bytes(data, algorithm, payload);
    if (!succeeded(status)) {
        return status;
    }
    return deserialize_delta(payload, delta);
}

Status DeltaCompressor::decompress_bytes(const std::vector<UInt8>& data,
                                         CompressionAlgorithm algorithm,
                                         std::vector<UInt8>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.decompressions;

    if (algorithm == CompressionAlgorithm::None) {
        payload = data;
        return Status::Success;
    }

    // Both real codecs inflate zlib and gzip streams, so a disabled codec is
    // covered by the other one.
    ICompressionCodec* decoder = nullptr;
    for (CompressionAlgorithm candidate : fallback_chain(algorithm)) {
        if (candidate != CompressionAlgorithm::None && is_available_locked(candidate)) {
            decoder = codecs_[index_of(candidate)].get();
            break;
        }
    }

    if (!decoder) {
        logger()->error("No codec available to decode {}", compression_algorithm_to_string(algorithm));
        return Status::CodecUnavailable;
    }

    Status status = decoder->decode(data, payload);
    if (!succeeded(status)) {
        ++stats_.codec_failures;
    }
    return status;
}

void DeltaCompressor::register_codec(std::unique_ptr<ICompressionCodec> codec) {
    if (!codec) return;

    std::lock_guard<std::mutex> lock(mutex_);
    const CompressionAlgorithm algorithm = codec->algorithm();
    if (algorithm == CompressionAlgorithm::None) {
        return;
    }
    codecs_[index_of(algorithm)] = std::move(codec);
    enabled_[index_of(algorithm)] = true;
}

void DeltaCompressor::set_codec_enabled(CompressionAlgorithm algorithm, bool enabled) {
    if (algorithm == CompressionAlgorithm::None) return;

    std::lock_guard<std::mutex> lock(mutex_);
    enabled_[index_of(algorithm)] = enabled;
}

bool DeltaCompressor::is_available(CompressionAlgorithm algorithm) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_available_locked(algorithm);
}

CompressionAlgorithm DeltaCompressor::resolve_algorithm(CompressionAlgorithm requested) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (CompressionAlgorithm candidate : fallback_chain(requested)) {
        if (is_available_locked(candidate)) {
            return candidate;
        }
    }
    return CompressionAlgorithm::None;
}

CompressionStats DeltaCompressor::get_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void DeltaCompressor::reset_statistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = CompressionStats{};
}

bool DeltaCompressor::is_available_locked(CompressionAlgorithm algorithm) const {
    if (algorithm == CompressionAlgorithm::None) {
        return true;
    }
    const SizeT index = index_of(algorithm);
    return index < COMPRESSION_ALGORITHM_COUNT && enabled_[index] && codecs_[index] != nullptr;
}

std::array<CompressionAlgorithm, 3>
DeltaCompressor::fallback_chain(CompressionAlgorithm requested) const {
    switch (requested) {
        case CompressionAlgorithm::Fast:
            return {CompressionAlgorithm::Fast, CompressionAlgorithm::HighRatio,
                    CompressionAlgorithm::None};
        case CompressionAlgorithm::HighRatio:
            return {CompressionAlgorithm::HighRatio, CompressionAlgorithm::Fast,
                    CompressionAlgorithm::None};
        case CompressionAlgorithm::None:
        default:
            return {CompressionAlgorithm::None, CompressionAlgorithm::None,
                    CompressionAlgorithm::None};
    }
}

} // namespace crdtperf::optimize
