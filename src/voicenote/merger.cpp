#include "merger.hpp"

#include "log.hpp"

#include <algorithm>
#include <vector>

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::string normalize_line(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    bool pending_space = false;
    for (char c : line) {
        if (is_blank(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string normalize_chunk(std::string_view text) {
    std::string out;
    bool pending_break = false;

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();

        auto line = normalize_line(text.substr(pos, eol - pos));
        if (line.empty()) {
            pending_break = !out.empty();
        } else {
            if (!out.empty()) out += pending_break ? "\n\n" : "\n";
            out += line;
            pending_break = false;
        }
        pos = eol + 1;
    }
    return out;
}

size_t count_failed(std::span<const TranscriptionOutcome> outcomes) {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const TranscriptionOutcome& o) { return !o.ok(); }));
}

std::string merge_transcripts(std::span<const TranscriptionOutcome> outcomes) {
    std::vector<const TranscriptionOutcome*> ordered;
    ordered.reserve(outcomes.size());
    for (const auto& o : outcomes) ordered.push_back(&o);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto* a, const auto* b) { return a->index < b->index; });

    std::string merged;
    for (const auto* o : ordered) {
        std::string chunk = o->ok() ? normalize_chunk(o->text) : std::string(kSegmentFailedSentinel);
        if (chunk.empty()) continue;
        if (!merged.empty()) merged += kParagraphSeparator;
        merged += chunk;
    }

    size_t failed = count_failed(outcomes);
    if (failed > 0) {
        logging::warn("merge", "merging {} valid and {} failed segments",
                      outcomes.size() - failed, failed);
    }
    logging::info("merge", "merged {} segments into {} bytes", outcomes.size(), merged.size());
    return merged;
}
