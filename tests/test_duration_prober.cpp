#include <catch2/catch_test_macros.hpp>

#include "media/duration_prober.hpp"

TEST_CASE("ffprobe output parsing", "[probe]") {

    SECTION("ValidOutput") {
        auto info = FfprobeProber::parse_output(R"({
            "programs": [],
            "streams": [ { "codec_name": "aac" } ],
            "format": { "format_name": "mov,mp4,m4a,3gp,3g2,mj2", "duration": "310.042000" }
        })");
        REQUIRE(info.has_value());
        REQUIRE(info->duration_s == 310.042);
        REQUIRE(info->container == "mov,mp4,m4a,3gp,3g2,mj2");
        REQUIRE(info->codec == "aac");
    }

    SECTION("DurationNotAvailable") {
        auto info = FfprobeProber::parse_output(R"({
            "streams": [ { "codec_name": "opus" } ],
            "format": { "format_name": "ogg", "duration": "N/A" }
        })");
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().kind == ErrorKind::Probe);
    }

    SECTION("ZeroDuration") {
        auto info = FfprobeProber::parse_output(R"({
            "streams": [ { "codec_name": "pcm_s16le" } ],
            "format": { "format_name": "wav", "duration": "0.000000" }
        })");
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().kind == ErrorKind::Probe);
    }

    SECTION("NoAudioStream") {
        auto info = FfprobeProber::parse_output(R"({
            "streams": [],
            "format": { "format_name": "mp4", "duration": "12.5" }
        })");
        REQUIRE_FALSE(info.has_value());
    }

    SECTION("MissingFormat") {
        auto info = FfprobeProber::parse_output(R"({ "streams": [] })");
        REQUIRE_FALSE(info.has_value());
    }

    SECTION("NotJson") {
        auto info = FfprobeProber::parse_output("moov atom not found");
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().kind == ErrorKind::Probe);
    }
}

TEST_CASE("ffprobe prober failures", "[probe]") {

    SECTION("UnreadableFile") {
        FfprobeProber prober;
        auto info = prober.probe("/tmp/vn_test_missing_recording.m4a");
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().kind == ErrorKind::Probe);
    }

    SECTION("ToolUnavailable") {
        FfprobeProber prober("vn-test-no-such-ffprobe");
        auto info = prober.probe("/bin/sh");
        REQUIRE_FALSE(info.has_value());
        REQUIRE(info.error().kind == ErrorKind::Probe);
        REQUIRE(info.error().message.find("not available") != std::string::npos);
    }

    SECTION("VerifyToolsReportsMissingTool") {
        auto versions = verify_tools("vn-test-no-such-ffmpeg", "vn-test-no-such-ffprobe");
        REQUIRE_FALSE(versions.has_value());
    }
}
