#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <traitstream/core/decode_metrics.h>
#include <traitstream/decode/envelope.h>
#include <traitstream/decode/trait_dispatcher.h>
#include <traitstream/decode/trait_record.h>
#include <traitstream/state/snapshot.h>

namespace traitstream::state {

// Latest known state of every object seen by a session.
struct AggregatedState {
    // objectId -> typeTag -> record
    std::map<std::string, std::map<std::string, decode::TraitRecord>> devices;
    std::optional<std::string> discoveredUserId;
    std::optional<std::string> discoveredStructureId;

    [[nodiscard]] const decode::TraitRecord* find(const std::string& objectId,
                                                  const std::string& typeTag) const;
    [[nodiscard]] std::size_t record_count() const noexcept;
};

/**
 * @brief Merges decoded envelopes into an AggregatedState.
 *
 * Records are last-write-wins per (objectId, typeTag). The discovered user id latches from the
 * first user-info trait and is overwritten whenever a lock reports who actuated it. The
 * discovered structure id latches from the structure-info object and is overwritten whenever
 * a structure-info trait carries a parseable legacy id.
 *
 * Not thread-safe; owned by a single session task.
 */
class StateAggregator {
public:
    struct ApplyResult {
        bool changed = false;
        std::size_t upserted = 0;
        StateSnapshot snapshot;
    };

    StateAggregator() = default;
    explicit StateAggregator(decode::TraitDispatcher dispatcher)
        : dispatcher_(std::move(dispatcher)) {}

    ApplyResult apply(const decode::Envelope& envelope);

    [[nodiscard]] StateSnapshot snapshot() const;
    [[nodiscard]] const AggregatedState& state() const noexcept { return state_; }

    void set_metrics(DecodeMetrics* metrics) noexcept { metrics_ = metrics; }

    void clear();

private:
    void update_latches(const decode::TraitRecord& record);

    decode::TraitDispatcher dispatcher_;
    AggregatedState state_;
    DecodeMetrics* metrics_ = nullptr;
};

} // namespace traitstream::state
