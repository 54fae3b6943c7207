#include "frame_splitter.hpp"
#include "../util.hpp"

#include <stdexcept>

namespace qwstream {

FrameSplit split_frames(const std::string& text, const std::string& delimiter,
                        size_t search_from) {
    if (delimiter.empty()) {
        throw std::invalid_argument("split_frames: delimiter must not be empty");
    }

    FrameSplit result;
    size_t start = 0;
    size_t pos = text.find(delimiter, search_from);
    while (pos != std::string::npos) {
        result.frames.push_back(text.substr(start, pos - start));
        start = pos + delimiter.size();
        pos = text.find(delimiter, start);
    }
    result.remainder = text.substr(start);
    return result;
}

std::vector<std::string> frame_payloads(const std::vector<std::string>& frames) {
    std::vector<std::string> payloads;
    payloads.reserve(frames.size());
    for (const auto& frame : frames) {
        std::string trimmed = trim(frame);
        if (!trimmed.empty()) payloads.push_back(std::move(trimmed));
    }
    return payloads;
}

} // namespace qwstream
