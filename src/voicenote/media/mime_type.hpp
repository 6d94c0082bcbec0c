#pragma once

#include <filesystem>
#include <string>

// MIME type for an upload, from its extension (case-insensitive).
// Unknown extensions map to application/octet-stream.
std::string guess_mime_type(const std::filesystem::path& path);
