#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// An archive member that was not materialized because it would escape the
// extraction root.
struct DroppedEntry {
    std::string name;
    std::string target; // symlink target, empty for other entries
    std::string reason;
};

struct ExtractionReport {
    std::set<std::string> top_levels;
    std::vector<DroppedEntry> dropped;
    size_t extracted = 0;
};

// Extracts a zip file into output_dir, which must exist and be empty.
// Directories and entries with an owner-execute bit get 0755, everything
// else 0644. Symlinks resolving outside output_dir and members whose own
// path escapes it are dropped and reported. Throws BadArchive when the file
// is not a readable zip container.
ExtractionReport extract_zip(const fs::path& archive_path, const fs::path& output_dir);
