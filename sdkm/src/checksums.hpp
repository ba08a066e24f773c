#pragma once

#include "manifest.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Parses checksums.json: an object mapping artifact URL to an array of
// {"source.properties": ..., "sha256": ...} records. Non-zip URLs are
// dropped. Throws SdkmException on malformed documents.
Manifest parse_manifest(const std::string& document);
Manifest load_manifest(const fs::path& path);

// ETag of the cached manifest, kept next to it as "<file>.etag".
fs::path etag_path_for(const fs::path& file);
// Empty when no ETag was stored.
std::string read_etag(const fs::path& etag_file);
// An empty etag removes the file.
void store_etag(const fs::path& etag_file, const std::string& etag);

// Returns the verified manifest. The signed copy in the cache is reused
// unless use_net is set or no cached copy exists; otherwise the configured
// mirrors are tried in order. A mirror is asked with the stored ETag and
// the cached copy is kept when it reports no change. A failed refresh
// leaves the cached copy untouched.
Manifest fetch_manifest(bool use_net);
