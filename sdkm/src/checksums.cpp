#include "checksums.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "signature.hpp"
#include "utils.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace {
    // Reads a string member; absent or null members yield nullopt.
    std::optional<std::string> string_member(const YAML::Node& record, const char* key) {
        const YAML::Node value = record[key];
        if (!value || value.IsNull()) {
            return std::nullopt;
        }
        if (!value.IsScalar()) {
            throw SdkmException(string_format("error.manifest_bad_member", std::string(key)));
        }
        return value.as<std::string>();
    }

    bool is_zip_url(const std::string& url) {
        return url.size() >= 4 && url.compare(url.size() - 4, 4, ".zip") == 0;
    }

    void discard(const fs::path& path) {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void replace_file(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec) {
            throw IOFailure(string_format("error.move_failed", from.string(), to.string(), ec.message()));
        }
    }

    // Downloads into a scratch copy and replaces the cached manifest only
    // after its signature verifies. Returns false when the mirror reported
    // the cached copy unchanged.
    bool download_from_mirror(const std::string& url, const std::string& etag) {
        const fs::path part = CHECKSUMS_FILE.string() + ".part";
        const fs::path part_signature = signature_path_for(part);
        try {
            const DownloadResult result = download_with_retries(url, part, 3, false, etag);
            if (result.not_modified) {
                log_info(string_format("info.manifest_unchanged", url));
                return false;
            }
            download_with_retries(url + ".asc", part_signature, 3, false);
            verify_signature(part, KEYRING_FILE);

            replace_file(part_signature, signature_path_for(CHECKSUMS_FILE));
            replace_file(part, CHECKSUMS_FILE);
            store_etag(etag_path_for(CHECKSUMS_FILE), result.etag);
            return true;
        } catch (...) {
            discard(part);
            discard(part_signature);
            throw;
        }
    }
}

Manifest parse_manifest(const std::string& document) {
    YAML::Node root;
    try {
        root = YAML::Load(document);
    } catch (const YAML::Exception& e) {
        throw SdkmException(string_format("error.manifest_parse_failed", std::string(e.what())));
    }
    if (!root.IsMap()) {
        throw SdkmException(get_string("error.manifest_not_object"));
    }

    Manifest manifest;
    try {
        for (const auto& item : root) {
            const std::string url = item.first.as<std::string>();
            if (!is_zip_url(url)) continue;

            const YAML::Node& records = item.second;
            if (!records.IsSequence()) {
                throw SdkmException(string_format("error.manifest_records_not_array", url));
            }

            std::vector<ManifestEntry> entries;
            for (const auto& record : records) {
                if (!record.IsMap()) {
                    throw SdkmException(string_format("error.manifest_records_not_array", url));
                }
                ManifestEntry entry;
                entry.url = url;
                if (auto text = string_member(record, "source.properties")) {
                    entry.properties = parse_properties(*text);
                }
                entry.sha256 = string_member(record, "sha256").value_or("");
                entries.push_back(std::move(entry));
            }
            manifest.emplace_back(url, std::move(entries));
        }
    } catch (const YAML::Exception& e) {
        throw SdkmException(string_format("error.manifest_parse_failed", std::string(e.what())));
    }

    log_debug(string_format("debug.manifest_urls", manifest.size()));
    return manifest;
}

Manifest load_manifest(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IOFailure(string_format("error.open_file_failed", path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_manifest(buffer.str());
}

fs::path etag_path_for(const fs::path& file) {
    return fs::path(file.string() + ".etag");
}

std::string read_etag(const fs::path& etag_file) {
    std::ifstream file(etag_file);
    if (!file.is_open()) {
        return "";
    }
    std::string etag;
    std::getline(file, etag);
    return etag;
}

void store_etag(const fs::path& etag_file, const std::string& etag) {
    if (etag.empty()) {
        remove_if_exists(etag_file);
        return;
    }
    std::ofstream file(etag_file, std::ios::trunc);
    file << etag << '\n';
    if (!file) {
        throw IOFailure(string_format("error.write_file_failed", etag_file.string()));
    }
}

Manifest fetch_manifest(bool use_net) {
    const fs::path signature = signature_path_for(CHECKSUMS_FILE);
    const bool cached = fs::exists(CHECKSUMS_FILE) && fs::exists(signature);
    if (!use_net && cached) {
        verify_signature(CHECKSUMS_FILE, KEYRING_FILE);
        return load_manifest(CHECKSUMS_FILE);
    }

    ensure_dir_exists(CHECKSUMS_FILE.parent_path());
    // Without a cached copy a 304 would leave nothing to read
    const std::string etag = cached ? read_etag(etag_path_for(CHECKSUMS_FILE)) : "";
    const std::vector<std::string> urls = get_checksums_urls();
    for (size_t i = 0; i < urls.size(); ++i) {
        try {
            log_info(string_format("info.fetching_manifest", urls[i]));
            if (!download_from_mirror(urls[i], etag)) {
                verify_signature(CHECKSUMS_FILE, KEYRING_FILE);
            }
            return load_manifest(CHECKSUMS_FILE);
        } catch (const ConfigurationError&) {
            throw;
        } catch (const SdkmException& e) {
            if (i + 1 == urls.size()) throw;
            log_warning(string_format("warning.mirror_failed", urls[i], e.what()));
        }
    }
    throw ConfigurationError(get_string("error.invalid_mirror_config"));
}
