#pragma once

#include <filesystem>
#include <string>

namespace metro {

// Replaces `path` with `contents` so that a crash leaves either the previous
// blob or the new one, never a torn file. The sequence is:
//   <path>.tmp written and fsync'd, renamed over <path>, parent dir fsync'd.
// Missing parent directories are created.
bool WriteFileAtomic(const std::filesystem::path& path, const std::string& contents, std::string& outError);

bool ReadFileText(const std::filesystem::path& path, std::string& outText, std::string& outError);

} // namespace metro
