#include <catch2/catch_test_macros.hpp>

#include "media/mime_type.hpp"

TEST_CASE("guess_mime_type", "[mime]") {
    SECTION("KnownExtensions") {
        REQUIRE(guess_mime_type("lecture.m4a") == "audio/m4a");
        REQUIRE(guess_mime_type("/uploads/class.mp3") == "audio/mpeg");
        REQUIRE(guess_mime_type("voice.opus") == "audio/ogg");
        REQUIRE(guess_mime_type("raw.wav") == "audio/wav");
    }

    SECTION("CaseInsensitive") {
        REQUIRE(guess_mime_type("LECTURE.M4A") == "audio/m4a");
        REQUIRE(guess_mime_type("Class.Mp3") == "audio/mpeg");
    }

    SECTION("UnknownOrMissingExtension") {
        REQUIRE(guess_mime_type("notes.txt") == "application/octet-stream");
        REQUIRE(guess_mime_type("recording") == "application/octet-stream");
    }

    SECTION("NonAsciiExtensionIsSafe") {
        REQUIRE(guess_mime_type("\xd8\xb5\xd8\xaf\xd8\xa7.\xd8\xb5\xd9\x88\xd8\xaa") == "application/octet-stream");
        REQUIRE(guess_mime_type("file.\xc3\x84\xc3\x9c") == "application/octet-stream");
    }
}
