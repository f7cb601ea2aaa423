#include <traitstream/session/session_worker.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/spdlog.h>

#include <traitstream/session/observe_request.h>

namespace traitstream::session {

SessionWorker::SessionWorker(std::shared_ptr<IStreamTransport> transport,
                             const config::SessionConfig& cfg)
    : SessionWorker(std::move(transport), build_observe_request(cfg.endpoint),
                    StreamSession::Options::from_config(cfg),
                    make_reconnect_policy(cfg.reconnect)) {}

SessionWorker::SessionWorker(std::shared_ptr<IStreamTransport> transport, StreamRequest request,
                             StreamSession::Options options,
                             std::unique_ptr<ReconnectPolicy> policy)
    : session_(std::make_unique<StreamSession>(io_.get_executor(), std::move(transport),
                                               std::move(request), options,
                                               std::move(policy))) {}

SessionWorker::~SessionWorker() {
    stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

Result<void> SessionWorker::start(SnapshotCallback onSnapshot) {
    if (started_) {
        return Error{ErrorCode::InvalidState, "Session worker already started"};
    }
    started_ = true;

    done_ = boost::asio::co_spawn(io_, session_->run(std::move(onSnapshot)),
                                  boost::asio::use_future);
    thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (const std::exception& e) {
            spdlog::error("SessionWorker: io thread exited with exception: {}", e.what());
        }
    });
    return Result<void>{};
}

void SessionWorker::stop() {
    if (started_) {
        session_->stop();
    }
}

Result<void> SessionWorker::wait() {
    if (!started_) {
        return Error{ErrorCode::InvalidState, "Session worker not started"};
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (!done_.valid()) {
        return Error{ErrorCode::InvalidState, "Session result already collected"};
    }
    try {
        return done_.get();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Session failed: ") + e.what()};
    }
}

bool SessionWorker::running() const noexcept {
    auto s = session_->state();
    return started_ && s != SessionState::Stopped;
}

} // namespace traitstream::session
