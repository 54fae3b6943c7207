#include <catch2/catch_test_macros.hpp>
#include "stream/utf8_decoder.hpp"
#include <string>

using namespace qwstream;

static const std::string kFFFD = "\xEF\xBF\xBD";

TEST_CASE("Utf8StreamDecoder: ASCII passes through", "[utf8]") {
    Utf8StreamDecoder dec;
    REQUIRE(dec.decode("hello") == "hello");
    REQUIRE(dec.pending() == 0);
    REQUIRE(dec.flush().empty());
}

TEST_CASE("Utf8StreamDecoder: complete multi-byte text passes through", "[utf8]") {
    Utf8StreamDecoder dec;
    std::string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    REQUIRE(dec.decode(text) == text);
}

TEST_CASE("Utf8StreamDecoder: holds back a sequence split across chunks", "[utf8]") {
    Utf8StreamDecoder dec;
    // U+20AC EURO SIGN = E2 82 AC
    REQUIRE(dec.decode("a\xE2") == "a");
    REQUIRE(dec.pending() == 1);
    REQUIRE(dec.decode("\x82").empty());
    REQUIRE(dec.pending() == 2);
    REQUIRE(dec.decode("\xAC" "b") == "\xE2\x82\xAC" "b");
    REQUIRE(dec.pending() == 0);
}

TEST_CASE("Utf8StreamDecoder: byte-at-a-time equals whole input", "[utf8]") {
    std::string text = "\xF0\x9F\x98\x80 grafo \xC3\xB1 \xE6\x97\xA5\xE6\x9C\xAC";
    Utf8StreamDecoder dec;
    std::string out;
    for (char c : text) out += dec.decode(&c, 1);
    out += dec.flush();
    REQUIRE(out == text);
}

TEST_CASE("Utf8StreamDecoder: invalid lead byte becomes U+FFFD", "[utf8]") {
    Utf8StreamDecoder dec;
    REQUIRE(dec.decode("a\xFF" "b") == "a" + kFFFD + "b");
    REQUIRE(dec.decode("\x80") == kFFFD);
}

TEST_CASE("Utf8StreamDecoder: truncated sequence then ASCII", "[utf8]") {
    Utf8StreamDecoder dec;
    // E2 82 needs one more continuation; 'x' is reprocessed as ASCII
    REQUIRE(dec.decode("\xE2\x82x") == kFFFD + "x");
}

TEST_CASE("Utf8StreamDecoder: overlong and surrogate encodings rejected", "[utf8]") {
    Utf8StreamDecoder dec;
    // C0 is never valid; E0 80 is overlong; ED A0 is a surrogate
    REQUIRE(dec.decode("\xC0\xAF") == kFFFD + kFFFD);
    REQUIRE(dec.decode("\xE0\x80") == kFFFD + kFFFD);
    REQUIRE(dec.decode("\xED\xA0\x80") == kFFFD + kFFFD + kFFFD);
}

TEST_CASE("Utf8StreamDecoder: flush replaces an incomplete tail", "[utf8]") {
    Utf8StreamDecoder dec;
    REQUIRE(dec.decode("ok\xF0\x9F") == "ok");
    REQUIRE(dec.pending() == 2);
    REQUIRE(dec.flush() == kFFFD);
    REQUIRE(dec.pending() == 0);
    REQUIRE(dec.flush().empty());
}
