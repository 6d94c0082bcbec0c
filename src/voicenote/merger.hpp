#pragma once

#include "transcription_pool.hpp"

#include <span>
#include <string>
#include <string_view>

inline constexpr std::string_view kSegmentFailedSentinel = "[SEGMENT FAILED]";
inline constexpr std::string_view kParagraphSeparator = "\n\n";

// Joins outcomes in segment index order: the normalized text of each Ok
// outcome, or the sentinel for each Failed one, separated by blank lines.
// Always succeeds; an all-failed input gives an all-sentinel document.
std::string merge_transcripts(std::span<const TranscriptionOutcome> outcomes);

// Trims every line, collapses runs of spaces/tabs to one space and runs of
// blank lines to one, and drops leading/trailing blank lines.
std::string normalize_chunk(std::string_view text);

size_t count_failed(std::span<const TranscriptionOutcome> outcomes);
