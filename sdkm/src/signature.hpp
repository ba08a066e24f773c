#pragma once

#include <filesystem>

namespace fs = std::filesystem;

// Checks file against its detached signature file + ".asc" with gpgv and
// the given keyring. On failure both files are removed and
// VerificationFailure is thrown; a missing keyring is a ConfigurationError.
void verify_signature(const fs::path& file, const fs::path& keyring);

fs::path signature_path_for(const fs::path& file);
