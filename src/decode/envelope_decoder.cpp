#include <traitstream/decode/envelope_decoder.h>

#include <nest/rpc/rpc.pb.h>

#include <google/protobuf/unknown_field_set.h>
#include <spdlog/spdlog.h>

#include <traitstream/core/protocol_constants.h>
#include <traitstream/decode/type_url.h>
#include <traitstream/schema/schema_registry.h>

namespace traitstream::decode {

namespace {

// Contents of the untyped lock slot, or nullopt when the get operation does not carry it.
std::optional<ByteVector> untyped_lock_slot(const nest::rpc::TraitGetProperty& get) {
    const auto& unknown = get.GetReflection()->GetUnknownFields(get);
    for (int i = 0; i < unknown.field_count(); ++i) {
        const auto& field = unknown.field(i);
        if (field.number() != kUntypedLockStateField) {
            continue;
        }
        if (field.type() == google::protobuf::UnknownField::TYPE_LENGTH_DELIMITED) {
            const auto& bytes = field.length_delimited();
            return ByteVector(bytes.begin(), bytes.end());
        }
        return ByteVector{};
    }
    return std::nullopt;
}

std::optional<TraitPayload> classify_payload(const nest::rpc::TraitGetProperty& get) {
    const bool hasProperty = get.has_data() && get.data().has_property();
    if (hasProperty && !get.data().property().type_url().empty()) {
        const auto& any = get.data().property();
        TraitPayload payload;
        payload.typeTag = normalize_type_url(any.type_url());
        payload.rawBytes.assign(any.value().begin(), any.value().end());
        return payload;
    }

    auto slot = untyped_lock_slot(get);
    if (!slot) {
        return std::nullopt;
    }
    TraitPayload payload;
    payload.typeTag = std::string(kCanonicalTypePrefix) + std::string(kPrimaryLockTraitType);
    payload.inferred = true;
    if (hasProperty && !get.data().property().value().empty()) {
        const auto& value = get.data().property().value();
        payload.rawBytes.assign(value.begin(), value.end());
    } else {
        payload.rawBytes = std::move(*slot);
    }
    return payload;
}

} // namespace

Result<Envelope> EnvelopeDecoder::decode(ByteSpan frame) const {
    auto parsed = schema::parse_stream_body(frame);
    if (!parsed) {
        if (metrics_) {
            metrics_->record_frame_decode_error();
        }
        return parsed.error();
    }
    const auto& body = parsed.value();

    Envelope envelope;
    envelope.keepalives = static_cast<std::size_t>(body.noop_size());
    if (body.has_status() && body.status().code() != 0) {
        spdlog::warn("Stream status {}: {}", body.status().code(), body.status().message());
    }

    envelope.messages.reserve(static_cast<std::size_t>(body.message_size()));
    for (const auto& message : body.message()) {
        SubMessage sub;
        sub.gets.reserve(static_cast<std::size_t>(message.get_size()));
        for (const auto& get : message.get()) {
            GetOperation op;
            if (get.has_object()) {
                if (!get.object().id().empty()) {
                    op.objectId = get.object().id();
                }
                if (!get.object().key().empty()) {
                    op.objectKey = get.object().key();
                }
            }

            op.traitPayload = classify_payload(get);
            if (!op.traitPayload) {
                ++envelope.dropped;
                spdlog::debug("Dropping untyped get operation on {}",
                              op.objectId.value_or("<no object>"));
                if (metrics_) {
                    metrics_->record_classification_miss(op.objectId.value_or(""));
                }
                continue;
            }
            if (op.traitPayload->inferred) {
                spdlog::debug("Untyped get operation on {} treated as {}",
                              op.objectId.value_or("<no object>"), kPrimaryLockTraitType);
            }
            if (metrics_) {
                metrics_->record_get_operation();
            }
            sub.gets.push_back(std::move(op));
        }
        envelope.messages.push_back(std::move(sub));
    }

    if (metrics_) {
        metrics_->record_frame();
        if (envelope.is_keepalive()) {
            metrics_->record_keepalive();
        }
    }
    spdlog::trace("Decoded frame: {} messages, {} operations, {} dropped, {} noop",
                  envelope.messages.size(), envelope.operation_count(), envelope.dropped,
                  envelope.keepalives);
    return envelope;
}

} // namespace traitstream::decode
