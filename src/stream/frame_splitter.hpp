#pragma once
#include <string>
#include <vector>

namespace qwstream {

// Boundary marker the query service writes between consecutive messages.
constexpr const char* kMessageBoundary = "|||FALKORDB_MESSAGE_BOUNDARY|||";

struct FrameSplit {
    std::vector<std::string> frames; // complete frames, untrimmed, in order
    std::string remainder;           // text after the last delimiter
};

// Split `text` on every occurrence of `delimiter`. Frames are returned
// exactly as they appear, so joining frames and remainder with the
// delimiter reproduces `text`. The first search starts at `search_from`;
// the caller guarantees no delimiter begins before it. Throws
// std::invalid_argument on an empty delimiter.
FrameSplit split_frames(const std::string& text, const std::string& delimiter,
                        size_t search_from = 0);

// Trim each frame and drop the ones left empty (consecutive delimiters,
// whitespace between messages).
std::vector<std::string> frame_payloads(const std::vector<std::string>& frames);

} // namespace qwstream
