/**
 * StreamDemux — turns a fragmented byte stream into frames.
 *
 * The receive buffer is append-only; consumed bytes are tracked by an
 * offset and compacted lazily so that large payloads arriving in small
 * reads do not cost a copy per read.
 */

#include "protocol/stream_demux.h"

#include "protocol/frame_codec.h"

#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace {

constexpr std::size_t kCompactThreshold = 64 * 1024;

Frame to_frame(HeaderLine&& decoded) {
    return std::visit([](auto&& value) -> Frame {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, FileHeader>) {
            return FileFrame{std::move(value), {}};
        } else {
            return std::move(value);
        }
    }, std::move(decoded));
}

} // namespace

StreamDemux::StreamDemux(Mode mode) : mode_(mode) {}

void StreamDemux::feed(const char* data, std::size_t len) {
    buffer_.append(data, len);
}

std::optional<Frame> StreamDemux::next() {
    if (receiving_) {
        return take_payload();
    }

    std::string_view view(buffer_);
    view.remove_prefix(head_);
    auto pos = view.find(FrameCodec::kDelimiter);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto line = view.substr(0, pos);

    if (FrameCodec::is_file_header(line)) {
        FileHeader header;
        try {
            header = std::get<FileHeader>(FrameCodec::decode_header_line(line));
        } catch (const FrameError&) {
            consume(pos + 1);
            throw;
        }

        if (mode_ == Mode::Relay) {
            // Header and payload leave the buffer together or not at all.
            auto available = view.size() - pos - 1;
            if (available < header.size) {
                return std::nullopt;
            }
            std::string payload(view.substr(pos + 1, header.size));
            FileFrame frame{std::move(header), std::move(payload)};
            consume(pos + 1 + frame.header.size);
            return Frame(std::move(frame));
        }

        consume(pos + 1);
        uint64_t size = header.size;
        receiving_ = ReceivingFile{std::move(header), size};
        return take_payload();
    }

    std::string owned(line);
    consume(pos + 1);
    return to_frame(FrameCodec::decode_header_line(owned));
}

std::optional<Frame> StreamDemux::take_payload() {
    auto& state = *receiving_;
    const uint64_t size = state.header.size;
    if (buffered() < size) {
        state.remaining = size - buffered();
        return std::nullopt;
    }
    FileFrame frame{std::move(state.header), buffer_.substr(head_, size)};
    receiving_.reset();
    consume(size);
    return Frame(std::move(frame));
}

void StreamDemux::consume(std::size_t n) {
    head_ += n;
    if (head_ >= buffer_.size()) {
        buffer_.clear();
        head_ = 0;
    } else if (head_ >= kCompactThreshold && head_ * 2 >= buffer_.size()) {
        buffer_.erase(0, head_);
        head_ = 0;
    }
}
