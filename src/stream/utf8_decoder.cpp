#include "utf8_decoder.hpp"

namespace qwstream {

static const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

std::string Utf8StreamDecoder::decode(const char* data, size_t len) {
    std::string buf;
    buf.swap(pending_);
    buf.append(data, len);

    std::string out;
    out.reserve(buf.size());

    size_t i = 0;
    while (i < buf.size()) {
        auto c = static_cast<unsigned char>(buf[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        // Expected continuation count and the allowed range of the first
        // continuation byte (excludes overlongs and surrogates).
        size_t need = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            need = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            need = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            need = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t j = i + 1;
        size_t seen = 0;
        bool invalid = false;
        while (seen < need && j < buf.size()) {
            auto b = static_cast<unsigned char>(buf[j]);
            if (b < lo || b > hi) {
                invalid = true;
                break;
            }
            lo = 0x80;
            hi = 0xBF;
            ++j;
            ++seen;
        }

        if (invalid) {
            // Replace the valid prefix, then reprocess the offending byte
            out += kReplacement;
            i = j;
            continue;
        }
        if (seen < need) {
            // Sequence continues in the next chunk
            pending_ = buf.substr(i);
            break;
        }
        out.append(buf, i, j - i);
        i = j;
    }
    return out;
}

std::string Utf8StreamDecoder::flush() {
    if (pending_.empty()) return {};
    pending_.clear();
    return kReplacement;
}

} // namespace qwstream
