#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <traitstream/core/protocol_constants.h>
#include <traitstream/core/types.h>

namespace traitstream::wire {

// Reassembles varint length-prefixed frames from an arbitrarily chunked byte stream.
//
// A new length prefix is only read once at least min_prefix_bytes are buffered, so a prefix
// that straddles two network reads is never decoded from a partial tail. Frame extraction is
// therefore independent of where the transport splits its chunks.
//
// The gate applies to every prefix read, the first one included. A complete frame whose prefix
// and payload together are shorter than min_prefix_bytes stays buffered until more bytes arrive;
// on the observe stream every such frame is followed by more traffic.
class FrameBuffer {
public:
    struct Options {
        std::size_t catalog_threshold = kDefaultCatalogThreshold;
        std::size_t max_buffer_bytes = kDefaultMaxBufferBytes;
        std::size_t min_prefix_bytes = kMinPrefixBytes;
    };

    struct Stats {
        uint64_t frames = 0;
        uint64_t bytes_ingested = 0;
        uint64_t empty_frames = 0;
        uint64_t malformed_prefixes = 0;
        uint64_t catalog_bursts = 0; // pending frame waited with the buffer past catalog_threshold
        uint64_t overflows = 0;      // declared frame larger than max_buffer_bytes
    };

    FrameBuffer() : FrameBuffer(Options{}) {}
    explicit FrameBuffer(Options options) : options_(options) {}

    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;
    FrameBuffer(FrameBuffer&&) = default;
    FrameBuffer& operator=(FrameBuffer&&) = default;

    // Append a chunk to the unread region.
    void ingest(ByteSpan chunk);

    // Slice off every frame that is complete in the buffer, in arrival order.
    [[nodiscard]] std::vector<ByteVector> extract_ready();

    // Drop buffered bytes and the pending length (used on reconnect).
    void reset() noexcept;

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size() - head_; }
    [[nodiscard]] std::optional<uint64_t> pending_length() const noexcept { return pending_; }
    [[nodiscard]] bool has_data() const noexcept { return buffered() != 0; }
    [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    enum class PrefixStatus { NeedMoreData, Ready, Malformed };

    PrefixStatus read_prefix();
    void compact();

    Options options_;
    Stats stats_;
    std::vector<uint8_t> buffer_;
    std::size_t head_ = 0;
    std::optional<uint64_t> pending_;
    bool burst_logged_ = false;
};

} // namespace traitstream::wire
