#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Calculates the SHA256 hash of a file as lowercase hex.
// Throws IOFailure if the file cannot be opened.
std::string calculate_sha256(const fs::path& file_path);

// Throws VerificationFailure and removes the file when its digest differs
// from expected (compared case-insensitively).
void verify_sha256(const fs::path& file_path, const std::string& expected);
