#include <traitstream/wire/frame_buffer.h>
#include <traitstream/wire/varint.h>

#include <spdlog/spdlog.h>

namespace traitstream::wire {

void FrameBuffer::ingest(ByteSpan chunk) {
    if (chunk.empty()) {
        return;
    }
    buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
    stats_.bytes_ingested += chunk.size();
}

FrameBuffer::PrefixStatus FrameBuffer::read_prefix() {
    const std::size_t available = buffered();
    if (available < options_.min_prefix_bytes) {
        return PrefixStatus::NeedMoreData;
    }

    auto unread = ByteSpan(buffer_).subspan(head_);
    auto decoded = decode_varint(unread, 0);
    if (!decoded.value) {
        if (available < kMaxVarintBytes) {
            // Prefix continues in the next read
            return PrefixStatus::NeedMoreData;
        }
        return PrefixStatus::Malformed;
    }

    pending_ = *decoded.value;
    head_ += decoded.next;
    burst_logged_ = false;
    spdlog::trace("FrameBuffer: pending frame of {} bytes ({} byte prefix), {} buffered",
                  *pending_, decoded.next, buffered());
    return PrefixStatus::Ready;
}

std::vector<ByteVector> FrameBuffer::extract_ready() {
    std::vector<ByteVector> frames;

    while (true) {
        if (!pending_) {
            auto status = read_prefix();
            if (status == PrefixStatus::NeedMoreData) {
                break;
            }
            if (status == PrefixStatus::Malformed) {
                ++stats_.malformed_prefixes;
                spdlog::warn("FrameBuffer: length prefix exceeds {} bytes, dropping {} buffered "
                             "bytes",
                             kMaxVarintBytes, buffered());
                reset();
                break;
            }
        }

        const uint64_t length = *pending_;
        if (length == 0) {
            // A zero length ends extraction for this read
            ++stats_.empty_frames;
            pending_.reset();
            spdlog::debug("FrameBuffer: zero-length frame, waiting for next read");
            break;
        }

        if (length > options_.max_buffer_bytes) {
            ++stats_.overflows;
            spdlog::warn("FrameBuffer: declared frame of {} bytes exceeds buffer limit {}, "
                         "resetting stream buffer",
                         length, options_.max_buffer_bytes);
            reset();
            break;
        }

        if (buffered() < length) {
            if (buffered() >= options_.catalog_threshold && !burst_logged_) {
                burst_logged_ = true;
                ++stats_.catalog_bursts;
                spdlog::info("FrameBuffer: catalog burst, {} bytes buffered waiting for {} byte "
                             "frame",
                             buffered(), length);
            }
            break;
        }

        const auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(head_);
        frames.emplace_back(first, first + static_cast<std::ptrdiff_t>(length));
        head_ += static_cast<std::size_t>(length);
        pending_.reset();
        ++stats_.frames;
    }

    compact();
    return frames;
}

void FrameBuffer::reset() noexcept {
    buffer_.clear();
    head_ = 0;
    pending_.reset();
    burst_logged_ = false;
}

void FrameBuffer::compact() {
    if (head_ == 0) {
        return;
    }
    if (head_ >= buffer_.size()) {
        buffer_.clear();
        head_ = 0;
        return;
    }
    // Only shift once the consumed prefix dominates the allocation
    if (head_ * 2 >= buffer_.size()) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }
}

} // namespace traitstream::wire
