#include "fetcher.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

CachingFetcher::CachingFetcher(fs::path cache_dir, int max_retries)
    : cache_dir_(std::move(cache_dir)), max_retries_(max_retries) {}

fs::path CachingFetcher::cache_path_for(const ArtifactRef& artifact) const {
    const auto slash = artifact.url.find_last_of('/');
    const std::string basename = slash == std::string::npos ? artifact.url : artifact.url.substr(slash + 1);
    if (basename.empty()) {
        throw SdkmException(string_format("error.url_without_filename", artifact.url));
    }
    return validate_path(basename, cache_dir_);
}

fs::path CachingFetcher::fetch(const ArtifactRef& artifact) {
    const fs::path target = cache_path_for(artifact);

    if (fs::is_regular_file(target)) {
        if (artifact.sha256.empty()) {
            log_debug(string_format("debug.cache_hit", target.string()));
            return target;
        }
        try {
            verify_sha256(target, artifact.sha256);
            log_debug(string_format("debug.cache_hit", target.string()));
            return target;
        } catch (const VerificationFailure& e) {
            // verify_sha256 already removed the stale copy
            log_warning(string_format("warning.stale_cache", target.string(), e.what()));
        }
    }

    ensure_dir_exists(cache_dir_);
    download_with_retries(artifact.url, target, max_retries_);
    if (artifact.sha256.empty()) {
        log_warning(string_format("warning.no_checksum", artifact.url));
    } else {
        verify_sha256(target, artifact.sha256);
    }
    return target;
}
