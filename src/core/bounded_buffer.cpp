// bounded_buffer.cpp - Character-capped capture buffer
#include "codebox/bounded_buffer.h"

#include <algorithm>

namespace codebox {

BoundedBuffer::BoundedBuffer(size_t capacity)
    : capacity_(capacity)
{
    data_.reserve(std::min<size_t>(capacity_, 64 * 1024));
}

void BoundedBuffer::Append(const char* data, size_t size) {
    if (size == 0) return;

    if (dropped_ > 0) {
        dropped_ += size;
        return;
    }

    const size_t room = capacity_ - data_.size();
    if (size <= room) {
        data_.append(data, size);
        return;
    }

    // Back off to a UTF-8 lead byte so the kept prefix stays valid
    size_t keep = room;
    while (keep > 0 && (static_cast<unsigned char>(data[keep]) & 0xC0) == 0x80) {
        --keep;
    }
    data_.append(data, keep);
    dropped_ += size - keep;
}

std::string BoundedBuffer::Render() const {
    std::string rendered = ReplaceInvalidUtf8(data_);
    if (dropped_ == 0) return rendered;
    if (!rendered.empty() && rendered.back() != '\n') {
        rendered += '\n';
    }
    rendered += "... [output truncated, " + std::to_string(dropped_) + " more bytes]";
    return rendered;
}

std::string ReplaceInvalidUtf8(const std::string& text) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            out.push_back(text[i]);
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;   // overlong
            if (lead == 0xED) high = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;   // overlong
            if (lead == 0xF4) high = 0x8F;  // above U+10FFFF
        }
        if (length == 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t valid = 1;
        while (valid < length && i + valid < text.size()) {
            const unsigned char next = static_cast<unsigned char>(text[i + valid]);
            const unsigned char min = valid == 1 ? low : 0x80;
            const unsigned char max = valid == 1 ? high : 0xBF;
            if (next < min || next > max) break;
            ++valid;
        }

        if (valid == length) {
            out.append(text, i, length);
        } else {
            out += kReplacement;
        }
        i += valid;
    }
    return out;
}

} // namespace codebox
