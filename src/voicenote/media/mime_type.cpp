#include "media/mime_type.hpp"

#include <algorithm>
#include <cctype>

std::string guess_mime_type(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".m4a") return "audio/m4a";
    if (ext == ".mp4") return "audio/mp4";
    if (ext == ".aac") return "audio/aac";
    if (ext == ".ogg" || ext == ".oga" || ext == ".opus") return "audio/ogg";
    if (ext == ".wav") return "audio/wav";
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".flac") return "audio/flac";
    return "application/octet-stream";
}
