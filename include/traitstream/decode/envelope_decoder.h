#pragma once

#include <traitstream/core/decode_metrics.h>
#include <traitstream/core/types.h>
#include <traitstream/decode/envelope.h>

namespace traitstream::decode {

// Parses complete frames into Envelopes. Type tags are normalized here, before any dispatch, and
// payloads without a tag go through the untyped lock-slot fallback or are dropped.
class EnvelopeDecoder {
public:
    EnvelopeDecoder() = default;
    explicit EnvelopeDecoder(DecodeMetrics* metrics) : metrics_(metrics) {}

    // CorruptedData when the frame is not a StreamBody. Unclassifiable operations are counted in
    // Envelope::dropped, never reported as errors.
    [[nodiscard]] Result<Envelope> decode(ByteSpan frame) const;

    void set_metrics(DecodeMetrics* metrics) noexcept { metrics_ = metrics; }

private:
    DecodeMetrics* metrics_ = nullptr;
};

} // namespace traitstream::decode
