#include <traitstream/session/stream_session.h>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <traitstream/core/scope_guard.h>

namespace traitstream::session {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

StreamSession::Options StreamSession::Options::from_config(const config::SessionConfig& cfg) {
    Options o;
    o.streamTimeout = cfg.stream.stream_timeout;
    o.keepalive = cfg.stream.keepalive;
    o.framing.catalog_threshold = cfg.framing.catalog_threshold;
    o.framing.max_buffer_bytes = cfg.framing.max_buffer_bytes;
    o.framing.min_prefix_bytes = cfg.framing.min_prefix_bytes;
    return o;
}

StreamSession::StreamSession(boost::asio::any_io_executor executor,
                             std::shared_ptr<IStreamTransport> transport, StreamRequest request,
                             Options options, std::unique_ptr<ReconnectPolicy> policy)
    : executor_(std::move(executor)), transport_(std::move(transport)),
      request_(std::move(request)), options_(options), policy_(std::move(policy)),
      frames_(options.framing), retryTimer_(executor_) {
    if (!policy_) {
        policy_ = std::make_unique<FixedDelayPolicy>();
    }
    if (options_.keepalive.count() <= 0) {
        options_.keepalive = kDefaultKeepaliveInterval;
    }
    decoder_.set_metrics(&metrics_);
    aggregator_.set_metrics(&metrics_);
}

StreamSession::~StreamSession() = default;

void StreamSession::set_state(SessionState s) {
    auto prev = state_.exchange(s, std::memory_order_acq_rel);
    if (prev != s) {
        spdlog::debug("StreamSession: {} -> {}", to_string(prev), to_string(s));
    }
}

void StreamSession::stop() {
    if (stopRequested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    spdlog::info("StreamSession: stop requested");
    boost::asio::post(executor_, [this]() {
        retryTimer_.cancel();
        if (activeStream_) {
            activeStream_->close();
        }
    });
}

bool StreamSession::emit(const SnapshotCallback& onSnapshot, const state::StateSnapshot& snapshot) {
    metrics_.record_emission();
    if (!onSnapshot) {
        return true;
    }
    try {
        return onSnapshot(snapshot);
    } catch (const std::exception& e) {
        spdlog::error("StreamSession: snapshot consumer threw, closing session: {}", e.what());
        return false;
    }
}

void StreamSession::sync_buffer_metrics() {
    const auto& stats = frames_.stats();
    for (; seenBursts_ < stats.catalog_bursts; ++seenBursts_) {
        metrics_.record_catalog_burst();
    }
    for (; seenOverflows_ < stats.overflows; ++seenOverflows_) {
        metrics_.record_buffer_overflow();
    }
}

bool StreamSession::process_frames(const SnapshotCallback& onSnapshot) {
    auto ready = frames_.extract_ready();
    sync_buffer_metrics();

    for (const auto& frame : ready) {
        auto envelope = decoder_.decode(frame);
        if (!envelope) {
            spdlog::warn("StreamSession: dropping {} byte frame: {}", frame.size(),
                         envelope.error().message);
            continue;
        }
        if (envelope.value().is_keepalive()) {
            spdlog::trace("StreamSession: keepalive");
            continue;
        }

        auto applied = aggregator_.apply(envelope.value());
        if (applied.changed && !emit(onSnapshot, applied.snapshot)) {
            return false;
        }
    }
    return true;
}

awaitable<Result<std::unique_ptr<IChunkStream>>> StreamSession::open_stream() {
    try {
        co_return co_await transport_->open(request_);
    } catch (const std::exception& e) {
        co_return Error{ErrorCode::NetworkError, std::string("Transport open threw: ") + e.what()};
    }
}

awaitable<Result<std::optional<ByteVector>>> StreamSession::next_chunk(IChunkStream& stream) {
    try {
        co_return co_await stream.next(options_.keepalive);
    } catch (const std::exception& e) {
        co_return Error{ErrorCode::NetworkError, std::string("Stream read threw: ") + e.what()};
    }
}

awaitable<Result<void>> StreamSession::pump(IChunkStream& stream,
                                            const SnapshotCallback& onSnapshot) {
    std::chrono::milliseconds idle{0};
    bool receivedData = false;

    while (!stop_requested()) {
        auto chunk = co_await next_chunk(stream);
        if (!chunk) {
            co_return chunk.error();
        }

        if (!chunk.value()) {
            idle += options_.keepalive;
            if (idle >= options_.streamTimeout) {
                co_return Error{ErrorCode::Timeout,
                                "No data for " + std::to_string(idle.count()) + "ms"};
            }
            continue;
        }

        idle = std::chrono::milliseconds{0};
        if (!receivedData) {
            receivedData = true;
            policy_->reset();
        }

        frames_.ingest(*chunk.value());
        if (!process_frames(onSnapshot)) {
            spdlog::info("StreamSession: consumer closed the stream");
            co_return Result<void>{};
        }
    }
    co_return Result<void>{};
}

awaitable<Result<void>> StreamSession::run(SnapshotCallback onSnapshot) {
    if (busy_) {
        co_return Error{ErrorCode::InvalidState, "Session is already running"};
    }
    busy_ = true;
    auto clearBusy = scope_exit([this]() { busy_ = false; });

    uint32_t consecutiveFailures = 0;
    bool firstAttempt = true;

    while (!stop_requested()) {
        set_state(SessionState::Connecting);
        if (!firstAttempt) {
            metrics_.record_reconnect();
        }
        firstAttempt = false;

        spdlog::info("StreamSession: connecting to {}", request_.url);
        auto opened = co_await open_stream();

        Error failure;
        if (!opened) {
            failure = opened.error();
        } else {
            auto stream = std::move(opened).value();
            activeStream_ = stream.get();
            auto release = scope_exit([this, &stream]() {
                stream->close();
                activeStream_ = nullptr;
            });
            frames_.reset();
            set_state(SessionState::Streaming);
            if (stop_requested()) {
                stream->close();
            }

            const auto ingestedBefore = frames_.stats().bytes_ingested;
            auto pumped = co_await pump(*stream, onSnapshot);
            if (frames_.stats().bytes_ingested != ingestedBefore) {
                consecutiveFailures = 0;
            }
            if (pumped) {
                break;
            }
            failure = pumped.error();
            if (pumped.error().code == ErrorCode::OperationCancelled && stop_requested()) {
                break;
            }
        }

        if (stop_requested()) {
            break;
        }

        set_state(SessionState::Disconnected);
        spdlog::warn("StreamSession: stream failed ({}): {}", errorToString(failure.code),
                     failure.message);
        if (!emit(onSnapshot, state::StateSnapshot::sentinel())) {
            break;
        }

        auto delay = policy_->next_delay(++consecutiveFailures);
        if (!delay) {
            spdlog::error("StreamSession: giving up after {} failed attempts ({} policy)",
                          consecutiveFailures, policy_->name());
            set_state(SessionState::Stopped);
            co_return Error{failure.code, "Reconnect attempts exhausted: " + failure.message};
        }

        spdlog::info("StreamSession: retrying in {}ms", delay->count());
        retryTimer_.expires_after(*delay);
        boost::system::error_code ec;
        co_await retryTimer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        if (ec && ec != boost::asio::error::operation_aborted) {
            spdlog::warn("StreamSession: retry timer failed: {}", ec.message());
        }
    }

    set_state(SessionState::Stopped);
    co_return Result<void>{};
}

awaitable<Result<state::StateSnapshot>> StreamSession::refresh() {
    if (busy_) {
        co_return Error{ErrorCode::InvalidState, "Cannot refresh while the session is running"};
    }
    busy_ = true;
    auto clearBusy = scope_exit([this]() { busy_ = false; });

    if (stop_requested()) {
        co_return state::StateSnapshot::sentinel();
    }

    set_state(SessionState::Connecting);
    spdlog::info("StreamSession: refreshing from {}", request_.url);
    auto opened = co_await open_stream();
    if (!opened) {
        spdlog::error("StreamSession: refresh failed to connect ({}): {}",
                      errorToString(opened.error().code), opened.error().message);
        set_state(SessionState::Idle);
        co_return state::StateSnapshot::sentinel();
    }

    auto stream = std::move(opened).value();
    activeStream_ = stream.get();
    auto release = scope_exit([this, &stream]() {
        stream->close();
        activeStream_ = nullptr;
    });
    frames_.reset();
    set_state(SessionState::Streaming);

    std::optional<state::StateSnapshot> found;
    auto pumped = co_await pump(*stream, [&found](const state::StateSnapshot& snapshot) {
        if (snapshot.deviceSummaries.empty()) {
            return true;
        }
        found = snapshot;
        return false;
    });
    set_state(SessionState::Idle);

    if (found) {
        co_return std::move(*found);
    }
    if (!pumped) {
        spdlog::error("StreamSession: refresh ended without lock state ({}): {}",
                      errorToString(pumped.error().code), pumped.error().message);
    } else {
        spdlog::warn("StreamSession: refresh ended without lock state");
    }
    co_return state::StateSnapshot::sentinel();
}

} // namespace traitstream::session
