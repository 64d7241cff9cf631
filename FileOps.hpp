/// @file
/// @brief File system helpers that throw IoFailure and log what they touch.
#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace crj_fix {

std::string ReadTextFile(const std::filesystem::path& path);

/// Bytes are written unchanged (binary mode, no newline translation).
void WriteTextFile(const std::filesystem::path& path, std::string_view text);

void AppendTextFile(const std::filesystem::path& path, std::string_view text);

// Logged variants: one line per action on @p log.

void CreateDirectory(const std::filesystem::path& path, std::ostream& log);
void CopyFile(const std::filesystem::path& from,
              const std::filesystem::path& to, std::ostream& log);
void RemoveDirectory(const std::filesystem::path& path, std::ostream& log);
void WriteFile(const std::filesystem::path& path, std::string_view text,
               std::ostream& log);

} // crj_fix
