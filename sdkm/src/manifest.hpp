#pragma once

#include "version.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Sequence of ';'-separated path segments, e.g. {"build-tools", "30.0.3"}.
using PackageIdentifier = std::vector<std::string>;

std::string render_identifier(const PackageIdentifier& id);
PackageIdentifier parse_identifier(std::string_view text);

// source.properties content, keys lower-cased.
using Properties = std::map<std::string, std::string, std::less<>>;

Properties parse_properties(std::string_view text);

struct ManifestEntry {
    std::string url;
    std::optional<Properties> properties; // empty when the record has no source.properties
    std::string sha256;
};

// Artifact URLs in document order, each with its records.
using Manifest = std::vector<std::pair<std::string, std::vector<ManifestEntry>>>;

enum class PackageFamily {
    BuildTools,
    CMake,
    CmdlineTools,
    Emulator,
    M2Repository,
    Ndk,
    PlatformTools,
    Platforms,
    SkiaParser,
    Tools
};

std::string_view family_name(PackageFamily family);

// Dispatches on the artifact file name; non-zip and unknown artifacts yield nullopt.
std::optional<PackageFamily> classify_url(std::string_view url);

// NDK artifacts carry one meaningful record; the rest are ignored.
bool family_reads_first_entry_only(PackageFamily family);

struct NormalizedEntry {
    PackageIdentifier identifier;
    std::vector<PackageIdentifier> aliases;
    Revision revision;
    // NDK release tag ("r25b") and the concrete revision it names, when both are known
    std::optional<std::pair<std::string, std::string>> ndk_release;
};

// Returns nullopt when the entry lacks the fields its family needs.
std::optional<NormalizedEntry> normalize_entry(PackageFamily family, const ManifestEntry& entry);
