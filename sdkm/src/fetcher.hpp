#pragma once

#include "package_index.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// Materializes an artifact as a local, verified file.
class ArtifactFetcher {
public:
    virtual ~ArtifactFetcher() = default;
    virtual fs::path fetch(const ArtifactRef& artifact) = 0;
};

// Keeps downloads in cache_dir under the URL's basename and reuses a cached
// file whose SHA-256 still matches the manifest.
class CachingFetcher : public ArtifactFetcher {
public:
    explicit CachingFetcher(fs::path cache_dir, int max_retries = 3);
    fs::path fetch(const ArtifactRef& artifact) override;

    fs::path cache_path_for(const ArtifactRef& artifact) const;

private:
    fs::path cache_dir_;
    int max_retries_;
};
