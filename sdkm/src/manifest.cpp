#include "manifest.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace {
    using FamilyHandler = std::optional<NormalizedEntry> (*)(const ManifestEntry&);

    const std::regex M2REPOSITORY_REVISION_REGEX(R"(android_m2repository_r([0-9]+)\.zip)");
    const std::regex NDK_RELEASE_REGEX(R"(r[1-9][0-9]?[a-z]?(?:-(?:rc|beta)[0-9]+)?)");
    const std::regex NDK_FILENAME_REGEX(R"(android-ndk-r([0-9]{1,3})([a-z])-linux)");

    std::string trim(std::string_view s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return std::string(s.substr(first, last - first + 1));
    }

    std::string_view basename_of(std::string_view url) {
        const auto slash = url.rfind('/');
        return slash == std::string_view::npos ? url : url.substr(slash + 1);
    }

    const std::string* property(const ManifestEntry& entry, std::string_view key) {
        if (!entry.properties) return nullptr;
        auto it = entry.properties->find(key);
        if (it == entry.properties->end() || it->second.empty()) return nullptr;
        return &it->second;
    }

    std::optional<NormalizedEntry> from_pkg_path(const ManifestEntry& entry) {
        const std::string* path = property(entry, "pkg.path");
        if (!path) return std::nullopt;

        NormalizedEntry out;
        out.identifier = parse_identifier(*path);
        if (const std::string* rev = property(entry, "pkg.revision")) {
            out.revision = parse_revision_or_lowest(*rev);
        }
        return out;
    }

    std::optional<NormalizedEntry> parse_build_tools(const ManifestEntry& entry) {
        const std::string* rev = property(entry, "pkg.revision");
        if (!rev) return std::nullopt;

        std::string segment = *rev;
        std::replace(segment.begin(), segment.end(), ' ', '-');

        NormalizedEntry out;
        out.identifier = {"build-tools", segment};
        out.revision = parse_revision_or_lowest(*rev);
        return out;
    }

    std::optional<NormalizedEntry> parse_emulator(const ManifestEntry& entry) {
        auto out = from_pkg_path(entry);
        if (!out) return std::nullopt;
        if (const std::string* rev = property(entry, "pkg.revision")) {
            out->aliases.push_back({out->identifier.front(), *rev});
        }
        return out;
    }

    std::optional<NormalizedEntry> parse_m2repository(const ManifestEntry& entry) {
        std::smatch m;
        if (!std::regex_search(entry.url, m, M2REPOSITORY_REVISION_REGEX)) return std::nullopt;

        const std::string revision = m[1].str();
        std::string no_leading_zeros = revision.substr(std::min(revision.find_first_not_of('0'), revision.size()));

        NormalizedEntry out;
        out.identifier = {"extras", "android", "m2repository"};
        out.aliases.push_back({"extras", "android", "m2repository", revision});
        if (!no_leading_zeros.empty() && no_leading_zeros != revision) {
            out.aliases.push_back({"extras", "android", "m2repository", no_leading_zeros});
        }
        out.revision = parse_revision_or_lowest(revision);
        return out;
    }

    std::optional<NormalizedEntry> parse_ndk(const ManifestEntry& entry) {
        const std::string filename(basename_of(entry.url));
        const std::string* rev = property(entry, "pkg.revision");

        std::optional<std::string> release;
        std::smatch m;
        if (std::regex_search(filename, m, NDK_RELEASE_REGEX)) {
            release = m.str();
        }
        if (!rev && !release) return std::nullopt;

        NormalizedEntry out;
        if (rev) {
            out.revision = parse_revision_or_lowest(*rev);
            out.identifier = {"ndk", *rev};
            out.aliases.push_back({"ndk-bundle", *rev});
            if (release) {
                out.aliases.push_back({"ndk", *release});
                out.aliases.push_back({"ndk-bundle", *release});
                out.ndk_release = std::make_pair(*release, *rev);
            }
            return out;
        }

        // Old NDKs have no source.properties, so the revision comes from the file name
        out.identifier = {"ndk", *release};
        out.aliases.push_back({"ndk-bundle", *release});
        out.revision.numbers = {1};
        if (std::regex_search(filename, m, NDK_FILENAME_REGEX)) {
            out.revision.numbers = {static_cast<std::uint64_t>(std::stoul(m[1].str())),
                                    static_cast<std::uint64_t>(m[2].str()[0] - 'a')};
        }
        return out;
    }

    // Full releases have a platform.version starting with a non-zero digit;
    // previews ("N", "O") never win.
    std::optional<NormalizedEntry> parse_platforms(const ManifestEntry& entry) {
        const std::string* api_level = property(entry, "androidversion.apilevel");
        const std::string* platform_version = property(entry, "platform.version");
        if (!api_level || !platform_version) return std::nullopt;

        std::string vstring = *platform_version;
        if (const std::string* rev = property(entry, "pkg.revision")) {
            vstring += "." + *rev;
        }
        if (vstring[0] < '1' || vstring[0] > '9') return std::nullopt;

        NormalizedEntry out;
        out.identifier = {"platforms", "android-" + *api_level};
        out.revision = parse_revision_or_lowest(vstring);
        return out;
    }

    std::optional<NormalizedEntry> parse_platform_tools(const ManifestEntry& entry) {
        const std::string* rev = property(entry, "pkg.revision");
        if (!rev) return std::nullopt;

        NormalizedEntry out;
        out.identifier = {"platform-tools", *rev};
        out.revision = parse_revision_or_lowest(*rev);
        return out;
    }

    std::optional<NormalizedEntry> parse_tools(const ManifestEntry& entry) {
        const std::string* rev = property(entry, "pkg.revision");
        if (!rev) return std::nullopt;

        const std::string* path = property(entry, "pkg.path");
        NormalizedEntry out;
        out.identifier = {path ? *path : "tools", *rev};
        out.revision = parse_revision_or_lowest(*rev);
        return out;
    }

    struct FamilyRule {
        PackageFamily family;
        std::string_view name;
        FamilyHandler handler;
    };

    constexpr std::array<FamilyRule, 10> FAMILY_RULES = {{
        {PackageFamily::BuildTools, "build-tools", parse_build_tools},
        {PackageFamily::CMake, "cmake", from_pkg_path},
        {PackageFamily::CmdlineTools, "cmdline-tools", from_pkg_path},
        {PackageFamily::Emulator, "emulator", parse_emulator},
        {PackageFamily::M2Repository, "m2repository", parse_m2repository},
        {PackageFamily::Ndk, "ndk", parse_ndk},
        {PackageFamily::PlatformTools, "platform-tools", parse_platform_tools},
        {PackageFamily::Platforms, "platforms", parse_platforms},
        {PackageFamily::SkiaParser, "skiaparser", from_pkg_path},
        {PackageFamily::Tools, "tools", parse_tools},
    }};

    const FamilyRule& rule_for(PackageFamily family) {
        return *std::find_if(FAMILY_RULES.begin(), FAMILY_RULES.end(),
                             [family](const FamilyRule& r) { return r.family == family; });
    }
}

std::string render_identifier(const PackageIdentifier& id) {
    std::string out;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i) out += ';';
        out += id[i];
    }
    return out;
}

PackageIdentifier parse_identifier(std::string_view text) {
    PackageIdentifier id;
    size_t start = 0, end = 0;
    while ((end = text.find(';', start)) != std::string_view::npos) {
        id.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    id.emplace_back(text.substr(start));
    return id;
}

Properties parse_properties(std::string_view text) {
    Properties props;
    std::string last_key;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        start = end + 1;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') continue;

        // Indented lines continue the previous value
        if (!last_key.empty() && (line[0] == ' ' || line[0] == '\t')) {
            props[last_key] += "\n" + trimmed;
            continue;
        }

        const auto eq = trimmed.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(std::string_view(trimmed).substr(0, eq));
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        props[key] = trim(std::string_view(trimmed).substr(eq + 1));
        last_key = std::move(key);
    }
    return props;
}

std::string_view family_name(PackageFamily family) {
    return rule_for(family).name;
}

std::optional<PackageFamily> classify_url(std::string_view url) {
    if (!url.ends_with(".zip")) return std::nullopt;

    const std::string_view basename = basename_of(url);
    if (basename.starts_with("build-tools")) return PackageFamily::BuildTools;
    if (basename.starts_with("cmake")) return PackageFamily::CMake;
    if (basename.starts_with("cmdline-tools") || basename.starts_with("commandlinetools")) return PackageFamily::CmdlineTools;
    if (basename.starts_with("emulator")) return PackageFamily::Emulator;
    if (basename.starts_with("android_m2repository_r")) return PackageFamily::M2Repository;
    if (url.find("ndk-") != std::string_view::npos) return PackageFamily::Ndk;
    if (basename.starts_with("platform-tools")) return PackageFamily::PlatformTools;
    if (basename.starts_with("android-") || basename.starts_with("platform-")) return PackageFamily::Platforms;
    if (basename.starts_with("skiaparser")) return PackageFamily::SkiaParser;
    if (basename.starts_with("tools") || basename.starts_with("sdk-tools-")) return PackageFamily::Tools;
    return std::nullopt;
}

bool family_reads_first_entry_only(PackageFamily family) {
    return family == PackageFamily::Ndk;
}

std::optional<NormalizedEntry> normalize_entry(PackageFamily family, const ManifestEntry& entry) {
    // Everything except m2repository and legacy NDKs is described by source.properties
    if (!entry.properties && family != PackageFamily::M2Repository && family != PackageFamily::Ndk) {
        return std::nullopt;
    }
    auto out = rule_for(family).handler(entry);
    if (out && out->identifier.empty()) return std::nullopt;
    return out;
}
