#include "TextDecoder.hpp"

#include "TestHeaders.hpp"

using namespace burrow;

namespace {
const string REPLACEMENT = "\xEF\xBF\xBD";
}

TEST_CASE("TextDecoder passes valid text through", "[TextDecoder]") {
  TextDecoder decoder;

  SECTION("ASCII") {
    REQUIRE(decoder.decode("echo hi\r\n") == "echo hi\r\n");
    REQUIRE(decoder.heldBack() == 0);
  }

  SECTION("Multi-byte characters") {
    // e-acute, euro sign, and a four byte emoji
    string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80";
    REQUIRE(decoder.decode(text) == text);
  }

  SECTION("Escape sequences are untouched") {
    string text = "\x1b[1;32mgreen\x1b[0m";
    REQUIRE(decoder.decode(text) == text);
  }
}

TEST_CASE("TextDecoder joins characters split across reads",
          "[TextDecoder]") {
  TextDecoder decoder;
  // euro sign split after its first byte
  REQUIRE(decoder.decode("price: \xE2") == "price: ");
  REQUIRE(decoder.heldBack() == 1);
  REQUIRE(decoder.decode("\x82") == "");
  REQUIRE(decoder.heldBack() == 2);
  REQUIRE(decoder.decode("\xAC!") == "\xE2\x82\xAC!");
  REQUIRE(decoder.heldBack() == 0);
}

TEST_CASE("TextDecoder replaces invalid bytes", "[TextDecoder]") {
  TextDecoder decoder;

  SECTION("Stray continuation byte") {
    REQUIRE(decoder.decode("a\x80" "b") == "a" + REPLACEMENT + "b");
  }

  SECTION("Invalid lead bytes") {
    REQUIRE(decoder.decode("\xC0\xFF") == REPLACEMENT + REPLACEMENT);
  }

  SECTION("Truncated sequence followed by ASCII") {
    REQUIRE(decoder.decode("\xE2\x82x") == REPLACEMENT + "x");
  }

  SECTION("Surrogates are rejected") {
    string out = decoder.decode("\xED\xA0\x80");
    REQUIRE(out.find(REPLACEMENT) == 0);
    REQUIRE(out.find("\xED") == string::npos);
  }

  SECTION("Held back bytes are replaced on flush") {
    REQUIRE(decoder.decode("ok\xF0\x9F") == "ok");
    REQUIRE(decoder.flush() == REPLACEMENT);
    REQUIRE(decoder.heldBack() == 0);
    REQUIRE(decoder.flush() == "");
  }
}

TEST_CASE("toValidUtf8 never holds bytes back", "[TextDecoder]") {
  REQUIRE(toValidUtf8("readme.txt") == "readme.txt");
  REQUIRE(toValidUtf8("bad\xE2\x82") == "bad" + REPLACEMENT);
  REQUIRE(toValidUtf8("") == "");
}

TEST_CASE("toLowerUtf8 folds beyond ASCII", "[TextDecoder]") {
  REQUIRE(toLowerUtf8("README.Md") == "readme.md");
  REQUIRE(toLowerUtf8("\xC3\x84RGER") == "\xC3\xA4rger");
  REQUIRE(toLowerUtf8("\xCE\xA3\xCE\x9F\xCE\xA6\xCE\x99\xCE\x91") ==
          "\xCF\x83\xCE\xBF\xCF\x86\xCE\xB9\xCE\xB1");
  // Characters without a lowercase form pass through
  REQUIRE(toLowerUtf8("\xE2\x82\xAC" "1") == "\xE2\x82\xAC" "1");
  REQUIRE(toLowerUtf8("A\xFF") == "a" + REPLACEMENT);
}
