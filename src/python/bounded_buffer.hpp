/*
 * bounded_buffer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_PYTHON_BOUNDED_BUFFER_HPP
#define WARDEN_PYTHON_BOUNDED_BUFFER_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace warden::python {

/**
 * @brief Size-capped text accumulator
 *
 * Holds at most capacity() bytes of payload. The write that crosses the cap
 * keeps the part that fits (cut at a UTF-8 character boundary), then the
 * truncation marker is appended once and every later write is dropped.
 */
class BoundedBuffer {
public:
    static constexpr std::string_view kTruncationMarker =
        "\n... [output truncated]\n";
    static constexpr size_t kDefaultCapacity = 1048576;

    struct AppendResult {
        std::string_view accepted;  ///< Part of the input that was kept
        bool truncatedNow{false};   ///< This call hit the cap
    };

    explicit BoundedBuffer(size_t capacity = kDefaultCapacity);

    /**
     * @brief Append text, honouring the cap
     */
    AppendResult append(std::string_view data);

    /**
     * @brief Stop accepting input and append the marker (idempotent)
     */
    void markTruncated();

    [[nodiscard]] const std::string& str() const noexcept { return buffer_; }
    [[nodiscard]] bool truncated() const noexcept { return truncated_; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Move the contents out; the truncation state is kept
     */
    [[nodiscard]] std::string take();

private:
    size_t capacity_;
    size_t payloadSize_{0};
    bool truncated_{false};
    std::string buffer_;
};

/**
 * @brief Longest prefix of data no longer than limit that ends on a UTF-8
 * character boundary
 */
[[nodiscard]] size_t utf8PrefixLength(std::string_view data, size_t limit) noexcept;

/**
 * @brief Number of code points in UTF-8 text
 */
[[nodiscard]] size_t utf8Length(std::string_view data) noexcept;

}  // namespace warden::python

#endif  // WARDEN_PYTHON_BOUNDED_BUFFER_HPP
