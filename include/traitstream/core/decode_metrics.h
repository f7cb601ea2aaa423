#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace traitstream {

/**
 * @brief Counters for the decode pipeline of one session.
 *
 * Counters are updated from the session's consumer task and may be read from any thread.
 */
class DecodeMetrics {
public:
    struct Snapshot {
        uint64_t frames = 0;
        uint64_t frame_decode_errors = 0;
        uint64_t keepalives = 0;
        uint64_t get_operations = 0;
        uint64_t classification_misses = 0;
        uint64_t trait_unpack_failures = 0;
        uint64_t catalog_bursts = 0;
        uint64_t buffer_overflows = 0;
        uint64_t reconnects = 0;
        uint64_t emissions = 0;
    };

    // Invoked with the object id (possibly empty) of every get operation dropped because its
    // trait payload had no type tag and no untyped lock slot.
    using ClassificationMissObserver = std::function<void(std::string_view objectId)>;

    void record_frame() noexcept { frames_.fetch_add(1, std::memory_order_relaxed); }
    void record_frame_decode_error() noexcept {
        frame_decode_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    void record_keepalive() noexcept { keepalives_.fetch_add(1, std::memory_order_relaxed); }
    void record_get_operation() noexcept {
        get_operations_.fetch_add(1, std::memory_order_relaxed);
    }
    void record_trait_unpack_failure() noexcept {
        trait_unpack_failures_.fetch_add(1, std::memory_order_relaxed);
    }
    void record_catalog_burst() noexcept {
        catalog_bursts_.fetch_add(1, std::memory_order_relaxed);
    }
    void record_buffer_overflow() noexcept {
        buffer_overflows_.fetch_add(1, std::memory_order_relaxed);
    }
    void record_reconnect() noexcept { reconnects_.fetch_add(1, std::memory_order_relaxed); }
    void record_emission() noexcept { emissions_.fetch_add(1, std::memory_order_relaxed); }

    void record_classification_miss(std::string_view objectId) {
        classification_misses_.fetch_add(1, std::memory_order_relaxed);
        ClassificationMissObserver observer;
        {
            std::lock_guard<std::mutex> lock(observerMutex_);
            observer = observer_;
        }
        if (observer) {
            observer(objectId);
        }
    }

    void set_classification_miss_observer(ClassificationMissObserver observer) {
        std::lock_guard<std::mutex> lock(observerMutex_);
        observer_ = std::move(observer);
    }

    Snapshot snapshot() const noexcept {
        Snapshot s;
        s.frames = frames_.load(std::memory_order_relaxed);
        s.frame_decode_errors = frame_decode_errors_.load(std::memory_order_relaxed);
        s.keepalives = keepalives_.load(std::memory_order_relaxed);
        s.get_operations = get_operations_.load(std::memory_order_relaxed);
        s.classification_misses = classification_misses_.load(std::memory_order_relaxed);
        s.trait_unpack_failures = trait_unpack_failures_.load(std::memory_order_relaxed);
        s.catalog_bursts = catalog_bursts_.load(std::memory_order_relaxed);
        s.buffer_overflows = buffer_overflows_.load(std::memory_order_relaxed);
        s.reconnects = reconnects_.load(std::memory_order_relaxed);
        s.emissions = emissions_.load(std::memory_order_relaxed);
        return s;
    }

private:
    std::atomic<uint64_t> frames_{0};                ///< Frames parsed into envelopes
    std::atomic<uint64_t> frame_decode_errors_{0};   ///< Frames dropped as unparseable
    std::atomic<uint64_t> keepalives_{0};            ///< Noop-only envelopes
    std::atomic<uint64_t> get_operations_{0};        ///< Classified get operations
    std::atomic<uint64_t> classification_misses_{0}; ///< Untyped operations dropped
    std::atomic<uint64_t> trait_unpack_failures_{0}; ///< Records stored with an error
    std::atomic<uint64_t> catalog_bursts_{0};        ///< Pending frames past the burst threshold
    std::atomic<uint64_t> buffer_overflows_{0};      ///< Buffer resets past the ceiling
    std::atomic<uint64_t> reconnects_{0};            ///< Transport attempts after the first
    std::atomic<uint64_t> emissions_{0};             ///< Snapshots delivered (sentinels included)

    mutable std::mutex observerMutex_;
    ClassificationMissObserver observer_;
};

} // namespace traitstream
