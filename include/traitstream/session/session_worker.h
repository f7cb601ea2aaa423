#pragma once

#include <future>
#include <memory>
#include <thread>

#include <boost/asio/io_context.hpp>

#include <traitstream/config/config.h>
#include <traitstream/core/types.h>
#include <traitstream/session/stream_session.h>

namespace traitstream::session {

// Runs one StreamSession on a dedicated io_context thread so transport reads never block the
// caller. The snapshot callback is invoked on that thread.
class SessionWorker {
public:
    SessionWorker(std::shared_ptr<IStreamTransport> transport, const config::SessionConfig& cfg);
    SessionWorker(std::shared_ptr<IStreamTransport> transport, StreamRequest request,
                  StreamSession::Options options, std::unique_ptr<ReconnectPolicy> policy);
    ~SessionWorker();

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    // InvalidState when already started.
    Result<void> start(SnapshotCallback onSnapshot);

    void stop();

    // Blocks until the session ends and returns its result.
    Result<void> wait();

    bool running() const noexcept;

    StreamSession& session() noexcept { return *session_; }
    const StreamSession& session() const noexcept { return *session_; }

private:
    boost::asio::io_context io_;
    std::unique_ptr<StreamSession> session_;
    std::thread thread_;
    std::future<Result<void>> done_;
    bool started_ = false;
};

} // namespace traitstream::session
