#include <catch2/catch_test_macros.hpp>

#include "merger.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

TranscriptionOutcome ok(size_t index, std::string text) {
    return TranscriptionOutcome{.index = index, .status = OutcomeStatus::Ok,
                                .text = std::move(text), .attempts = 1};
}

TranscriptionOutcome failed(size_t index) {
    return TranscriptionOutcome{.index = index, .status = OutcomeStatus::Failed,
                                .attempts = 3, .error = "503"};
}

} // namespace

TEST_CASE("Merger", "[merger]") {

    SECTION("SentinelBetweenNeighbours") {
        std::vector<TranscriptionOutcome> outcomes = {ok(0, "A"), failed(1), ok(2, "C")};
        REQUIRE(merge_transcripts(outcomes) == "A\n\n[SEGMENT FAILED]\n\nC");
    }

    SECTION("OrderIndependentOfCollectionOrder") {
        std::vector<TranscriptionOutcome> in_order = {ok(0, "one"), ok(1, "two"), failed(2), ok(3, "four")};
        auto expected = merge_transcripts(in_order);

        std::vector<TranscriptionOutcome> shuffled = {in_order[2], in_order[0], in_order[3], in_order[1]};
        REQUIRE(merge_transcripts(shuffled) == expected);

        std::reverse(shuffled.begin(), shuffled.end());
        REQUIRE(merge_transcripts(shuffled) == expected);
        REQUIRE(expected == "one\n\ntwo\n\n[SEGMENT FAILED]\n\nfour");
    }

    SECTION("Idempotent") {
        std::vector<TranscriptionOutcome> outcomes = {ok(0, "  first  part "), failed(1), ok(2, "end.\n\n\n")};
        REQUIRE(merge_transcripts(outcomes) == merge_transcripts(outcomes));
    }

    SECTION("AllFailedStillMerges") {
        std::vector<TranscriptionOutcome> outcomes = {failed(0), failed(1)};
        REQUIRE(merge_transcripts(outcomes) == "[SEGMENT FAILED]\n\n[SEGMENT FAILED]");
        REQUIRE(count_failed(outcomes) == 2);
    }

    SECTION("EmptyInput") {
        REQUIRE(merge_transcripts({}).empty());
    }

    SECTION("EmptySuccessfulChunkIsSkipped") {
        std::vector<TranscriptionOutcome> outcomes = {ok(0, "A"), ok(1, " \n\t "), ok(2, "C")};
        REQUIRE(merge_transcripts(outcomes) == "A\n\nC");
    }

    SECTION("WhitespaceNormalization") {
        REQUIRE(normalize_chunk("  hello   world  ") == "hello world");
        REQUIRE(normalize_chunk("line one\n   line two\t\t here  \n") == "line one\nline two here");
        REQUIRE(normalize_chunk("\n\npara one\n\n\n\npara two\n\n") == "para one\n\npara two");
        REQUIRE(normalize_chunk("crlf\r\nlines\r\n") == "crlf\nlines");
        REQUIRE(normalize_chunk("") == "");
    }

    SECTION("WordingIsPreserved") {
        std::string persian = "این یک جمله است. عدد ۱۲۳ را ثبت کن؛ فقط همین!";
        std::vector<TranscriptionOutcome> outcomes = {ok(0, persian)};
        REQUIRE(merge_transcripts(outcomes) == persian);
    }
}
