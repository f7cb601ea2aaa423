#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <traitstream/config/config.h>
#include <traitstream/core/decode_metrics.h>
#include <traitstream/core/types.h>
#include <traitstream/decode/envelope_decoder.h>
#include <traitstream/session/reconnect_policy.h>
#include <traitstream/session/stream_transport.h>
#include <traitstream/state/state_aggregator.h>
#include <traitstream/wire/frame_buffer.h>

namespace traitstream::session {

enum class SessionState { Idle, Connecting, Streaming, Disconnected, Stopped };

constexpr std::string_view to_string(SessionState s) {
    switch (s) {
        case SessionState::Idle:
            return "idle";
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Streaming:
            return "streaming";
        case SessionState::Disconnected:
            return "disconnected";
        case SessionState::Stopped:
            return "stopped";
    }
    return "unknown";
}

// Receives every snapshot. Returning false closes the stream and ends run().
using SnapshotCallback = std::function<bool(const state::StateSnapshot&)>;

/**
 * @brief Drives one observe stream: Connecting -> Streaming -> Disconnected -> Connecting.
 *
 * run() reads chunks from the transport, reassembles frames, decodes them and folds them into
 * the aggregated state, emitting a snapshot whenever a frame changed it. A transport failure
 * or stream timeout emits an empty sentinel snapshot, resets the frame buffer and reconnects
 * after the policy delay. Aggregated state survives reconnects.
 *
 * Exceptions thrown by the transport are treated like transport errors: they end the current
 * attempt, never the session.
 *
 * run() and refresh() must be awaited one at a time, on the executor passed to the constructor.
 * stop() may be called from any thread. It posts work that touches the session, so the session
 * must outlive the executor's processing of that work (SessionWorker guarantees this by joining
 * its io thread before destroying the session).
 */
class StreamSession {
public:
    struct Options {
        std::chrono::milliseconds streamTimeout{kDefaultStreamTimeout};
        std::chrono::milliseconds keepalive{kDefaultKeepaliveInterval};
        wire::FrameBuffer::Options framing{};

        static Options from_config(const config::SessionConfig& cfg);
    };

    StreamSession(boost::asio::any_io_executor executor, std::shared_ptr<IStreamTransport> transport,
                  StreamRequest request, Options options,
                  std::unique_ptr<ReconnectPolicy> policy = nullptr);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Completes when the consumer declines a snapshot, stop() is called, or the reconnect
    // policy gives up (the last transport error is returned).
    boost::asio::awaitable<Result<void>> run(SnapshotCallback onSnapshot);

    // One-shot read without reconnect: opens the stream, folds frames into the aggregated state
    // and returns the first snapshot that carries a lock summary. Transport failure, timeout or
    // stop yields the empty sentinel snapshot. InvalidState while run() is active.
    boost::asio::awaitable<Result<state::StateSnapshot>> refresh();

    void stop();

    SessionState state() const noexcept { return state_.load(std::memory_order_acquire); }
    bool stop_requested() const noexcept { return stopRequested_.load(std::memory_order_acquire); }

    const DecodeMetrics& metrics() const noexcept { return metrics_; }
    DecodeMetrics& metrics() noexcept { return metrics_; }
    const state::StateAggregator& aggregator() const noexcept { return aggregator_; }
    const wire::FrameBuffer& frame_buffer() const noexcept { return frames_; }

private:
    // Both convert exceptions thrown by the transport into NetworkError.
    boost::asio::awaitable<Result<std::unique_ptr<IChunkStream>>> open_stream();
    boost::asio::awaitable<Result<std::optional<ByteVector>>> next_chunk(IChunkStream& stream);

    // Success means the session should end; an error means the transport failed.
    boost::asio::awaitable<Result<void>> pump(IChunkStream& stream,
                                              const SnapshotCallback& onSnapshot);
    bool process_frames(const SnapshotCallback& onSnapshot);
    bool emit(const SnapshotCallback& onSnapshot, const state::StateSnapshot& snapshot);
    void sync_buffer_metrics();
    void set_state(SessionState s);

    boost::asio::any_io_executor executor_;
    std::shared_ptr<IStreamTransport> transport_;
    StreamRequest request_;
    Options options_;
    std::unique_ptr<ReconnectPolicy> policy_;

    wire::FrameBuffer frames_;
    decode::EnvelopeDecoder decoder_;
    state::StateAggregator aggregator_;
    DecodeMetrics metrics_;

    boost::asio::steady_timer retryTimer_;
    IChunkStream* activeStream_ = nullptr; // touched only on executor_
    bool busy_ = false;                    // run() or refresh() in progress; executor_ only
    std::atomic<bool> stopRequested_{false};
    std::atomic<SessionState> state_{SessionState::Idle};
    uint64_t seenBursts_ = 0;
    uint64_t seenOverflows_ = 0;
};

} // namespace traitstream::session
