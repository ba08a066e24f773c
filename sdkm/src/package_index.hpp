#pragma once

#include "manifest.hpp"
#include "version.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

struct ArtifactRef {
    std::string url;
    Revision revision;
    std::string sha256;
};

// Identifier -> artifact, holding at most one artifact per identifier.
class PackageIndex {
public:
    // Stores ref unless the identifier already maps to a strictly higher
    // revision; on equal revisions the later offer wins. Returns true when
    // ref was stored.
    bool offer(const PackageIdentifier& id, const ArtifactRef& ref);

    // Unconditional replacement, used by the alias passes.
    void assign(const PackageIdentifier& id, const ArtifactRef& ref);

    const ArtifactRef* find(const PackageIdentifier& id) const;
    // Position of the last store to id among all stores; later stores rank higher.
    size_t stored_at(const PackageIdentifier& id) const;
    bool contains(const PackageIdentifier& id) const { return find(id) != nullptr; }
    size_t size() const { return entries_.size(); }
    const std::map<PackageIdentifier, ArtifactRef>& entries() const { return entries_; }
    std::vector<std::string> rendered_identifiers() const;

    void record_ndk_release(const std::string& release, const std::string& revision);
    // Concrete revision for an NDK release tag, or the tag itself when unknown.
    std::string ndk_revision_for(const std::string& release) const;

private:
    std::map<PackageIdentifier, ArtifactRef> entries_;
    std::map<PackageIdentifier, size_t> stored_at_;
    size_t stores_ = 0;
    std::map<std::string, std::string> ndk_revisions_;
};

// Points alias at the concrete (family, version) identifier whose version
// ranks highest among those accepted by the predicate. Equal versions
// ("30.0" and "30.0.0") go to the identifier stored last.
struct AliasRule {
    std::string family;
    PackageIdentifier alias;
    std::function<bool(std::string_view version)> accepts;
};

void apply_alias_rule(PackageIndex& index, const AliasRule& rule);

// cmdline-tools;latest, platform-tools, tools, ndk-bundle, in that order.
const std::vector<AliasRule>& default_alias_rules();

PackageIndex build_package_index(const Manifest& manifest);
