#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <traitstream/core/types.h>

namespace traitstream::session {

// Everything needed to open the long-lived observe response.
struct StreamRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    ByteVector body;
};

/**
 * @brief One open streaming response body.
 *
 * next() yields the next chunk of raw bytes, std::nullopt when no data arrived within the idle
 * window, or an error. End of stream is reported as ErrorCode::NetworkError. After close() any
 * pending or later next() completes with ErrorCode::OperationCancelled. close() may be called
 * more than once.
 */
class IChunkStream {
public:
    virtual ~IChunkStream() = default;

    virtual boost::asio::awaitable<Result<std::optional<ByteVector>>>
    next(std::chrono::milliseconds idleWindow) = 0;

    virtual void close() noexcept = 0;
};

// Opens streaming reads. HTTP, TLS and authentication live behind this seam.
class IStreamTransport {
public:
    virtual ~IStreamTransport() = default;

    virtual boost::asio::awaitable<Result<std::unique_ptr<IChunkStream>>>
    open(const StreamRequest& request) = 0;
};

} // namespace traitstream::session
