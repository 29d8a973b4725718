/*
 * bounded_buffer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "bounded_buffer.hpp"

namespace warden::python {

size_t utf8PrefixLength(std::string_view data, size_t limit) noexcept {
    if (data.size() <= limit) {
        return data.size();
    }
    size_t cut = limit;
    // Step back over continuation bytes (10xxxxxx)
    while (cut > 0 &&
           (static_cast<unsigned char>(data[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

size_t utf8Length(std::string_view data) noexcept {
    size_t count = 0;
    for (char c : data) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

BoundedBuffer::BoundedBuffer(size_t capacity) : capacity_(capacity) {}

BoundedBuffer::AppendResult BoundedBuffer::append(std::string_view data) {
    if (truncated_ || data.empty()) {
        return {};
    }

    size_t room = capacity_ - payloadSize_;
    if (data.size() <= room) {
        buffer_.append(data);
        payloadSize_ += data.size();
        return {data, false};
    }

    auto kept = data.substr(0, utf8PrefixLength(data, room));
    buffer_.append(kept);
    payloadSize_ += kept.size();
    markTruncated();
    return {kept, true};
}

void BoundedBuffer::markTruncated() {
    if (truncated_) {
        return;
    }
    truncated_ = true;
    buffer_.append(kTruncationMarker);
}

std::string BoundedBuffer::take() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

}  // namespace warden::python
