#include <catch2/catch_test_macros.hpp>
#include "stream/frame_splitter.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace qwstream;

static std::string join(const FrameSplit& split, const std::string& delim) {
    std::string out;
    for (const auto& f : split.frames) out += f + delim;
    return out + split.remainder;
}

// ── split_frames ─────────────────────────────────────────────────

TEST_CASE("split_frames: no delimiter leaves everything in remainder", "[frames]") {
    auto split = split_frames(R"({"type":"status"})", "|||");
    REQUIRE(split.frames.empty());
    REQUIRE(split.remainder == R"({"type":"status"})");
}

TEST_CASE("split_frames: complete frames and a partial tail", "[frames]") {
    auto split = split_frames("a|||b|||c", "|||");
    REQUIRE(split.frames == std::vector<std::string>{"a", "b"});
    REQUIRE(split.remainder == "c");
}

TEST_CASE("split_frames: trailing delimiter leaves empty remainder", "[frames]") {
    auto split = split_frames("a|||", "|||");
    REQUIRE(split.frames == std::vector<std::string>{"a"});
    REQUIRE(split.remainder.empty());
}

TEST_CASE("split_frames: consecutive delimiters produce empty frames", "[frames]") {
    auto split = split_frames("|||a||||||b", "|||");
    REQUIRE(split.frames == std::vector<std::string>{"", "a", ""});
    REQUIRE(split.remainder == "b");
}

TEST_CASE("split_frames: empty input", "[frames]") {
    auto split = split_frames("", kMessageBoundary);
    REQUIRE(split.frames.empty());
    REQUIRE(split.remainder.empty());
}

TEST_CASE("split_frames: empty delimiter is rejected", "[frames]") {
    REQUIRE_THROWS_AS(split_frames("abc", ""), std::invalid_argument);
}

TEST_CASE("split_frames: partial delimiter stays in remainder", "[frames]") {
    std::string delim = kMessageBoundary;
    auto split = split_frames("{\"a\":1}" + delim.substr(0, 10), delim);
    REQUIRE(split.frames.empty());
    REQUIRE(split.remainder == "{\"a\":1}" + delim.substr(0, 10));
}

TEST_CASE("split_frames: search start skips a known delimiter-free prefix", "[frames]") {
    std::string delim = kMessageBoundary;
    std::string head = "{\"type\":\"content\",\"content\":\"long\"}";
    // The delimiter straddles the resume point: half of it was already there
    std::string text = head + delim + "next";
    size_t resume = head.size() + 5;
    auto split = split_frames(text, delim, resume - delim.size() + 1);
    REQUIRE(split.frames.size() == 1);
    REQUIRE(split.frames[0] == head);
    REQUIRE(split.remainder == "next");
}

TEST_CASE("split_frames: search start past the end finds nothing", "[frames]") {
    auto split = split_frames("abc", kMessageBoundary, 10);
    REQUIRE(split.frames.empty());
    REQUIRE(split.remainder == "abc");
}

TEST_CASE("split_frames: joining frames and remainder reproduces input", "[frames]") {
    std::string delim = kMessageBoundary;
    std::string text = " x " + delim + delim + "\n{\"type\":\"done\"}\n" + delim + "tail";
    REQUIRE(join(split_frames(text, delim), delim) == text);
}

TEST_CASE("split_frames: lossless when the remainder is threaded through", "[frames]") {
    std::string delim = kMessageBoundary;
    std::string text = "one" + delim + "two" + delim + "three" + delim + "four";

    // Feed in slices of every width, carrying the remainder forward
    for (size_t width = 1; width <= text.size(); width++) {
        std::vector<std::string> frames;
        std::string carry;
        for (size_t pos = 0; pos < text.size(); pos += width) {
            carry += text.substr(pos, width);
            auto split = split_frames(carry, delim);
            frames.insert(frames.end(), split.frames.begin(), split.frames.end());
            carry = split.remainder;
        }
        REQUIRE(frames == std::vector<std::string>{"one", "two", "three"});
        REQUIRE(carry == "four");
    }
}

// ── frame_payloads ───────────────────────────────────────────────

TEST_CASE("frame_payloads: trims and drops empty frames", "[frames]") {
    auto payloads = frame_payloads({"  a ", "", " \n\t", "\nb\n"});
    REQUIRE(payloads == std::vector<std::string>{"a", "b"});
}

TEST_CASE("frame_payloads: keeps order", "[frames]") {
    auto payloads = frame_payloads({"3", "1", "2"});
    REQUIRE(payloads == std::vector<std::string>{"3", "1", "2"});
}
