#pragma once
#include <string>
#include <cstddef>

namespace qwstream {

// Incremental UTF-8 decoder for a byte stream that arrives in arbitrary
// chunks. A multi-byte sequence cut by a chunk boundary is held back until
// the rest arrives. Malformed input becomes U+FFFD (one per maximal invalid
// subpart, as browsers' TextDecoder does), so no byte is silently dropped.
class Utf8StreamDecoder {
public:
    // Decode a chunk; returns the text that is complete so far.
    std::string decode(const char* data, size_t len);
    std::string decode(const std::string& chunk) { return decode(chunk.data(), chunk.size()); }

    // End of input: an incomplete trailing sequence becomes U+FFFD.
    std::string flush();

    // Bytes held back waiting for the rest of a sequence
    size_t pending() const { return pending_.size(); }

private:
    std::string pending_;
};

} // namespace qwstream
