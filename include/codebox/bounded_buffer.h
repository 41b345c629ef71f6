// bounded_buffer.h - Character-capped capture buffer for guest output
#pragma once

#include "api_export.h"
#include <cstddef>
#include <string>

namespace codebox {

/**
 * Accumulates text up to a fixed capacity. Bytes past the cap are counted
 * and discarded so a chatty guest cannot grow host memory. The cut never
 * splits a UTF-8 sequence.
 */
class CODEBOX_API BoundedBuffer {
public:
    explicit BoundedBuffer(size_t capacity);

    void Append(const char* data, size_t size);
    void Append(const std::string& text) { Append(text.data(), text.size()); }

    const std::string& Data() const { return data_; }
    size_t Capacity() const { return capacity_; }
    size_t DroppedBytes() const { return dropped_; }
    bool IsTruncated() const { return dropped_ > 0; }

    // Data plus a marker line when anything was dropped, with invalid UTF-8
    // replaced by U+FFFD
    std::string Render() const;

private:
    size_t capacity_;
    size_t dropped_ = 0;
    std::string data_;
};

// Replaces each maximal invalid UTF-8 subsequence with U+FFFD
CODEBOX_API std::string ReplaceInvalidUtf8(const std::string& text);

} // namespace codebox
