#include "package_index.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <optional>

bool PackageIndex::offer(const PackageIdentifier& id, const ArtifactRef& ref) {
    auto it = entries_.find(id);
    if (it != entries_.end() && ref.revision < it->second.revision) {
        return false;
    }
    assign(id, ref);
    return true;
}

void PackageIndex::assign(const PackageIdentifier& id, const ArtifactRef& ref) {
    entries_.insert_or_assign(id, ref);
    stored_at_[id] = ++stores_;
}

const ArtifactRef* PackageIndex::find(const PackageIdentifier& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

size_t PackageIndex::stored_at(const PackageIdentifier& id) const {
    auto it = stored_at_.find(id);
    return it == stored_at_.end() ? 0 : it->second;
}

std::vector<std::string> PackageIndex::rendered_identifiers() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [id, ref] : entries_) {
        names.push_back(render_identifier(id));
    }
    return names;
}

void PackageIndex::record_ndk_release(const std::string& release, const std::string& revision) {
    ndk_revisions_[release] = revision;
}

std::string PackageIndex::ndk_revision_for(const std::string& release) const {
    auto it = ndk_revisions_.find(release);
    return it == ndk_revisions_.end() ? release : it->second;
}

// Scans the whole index for every rule; the index holds a few hundred
// entries at most.
void apply_alias_rule(PackageIndex& index, const AliasRule& rule) {
    const ArtifactRef* best = nullptr;
    const PackageIdentifier* best_id = nullptr;
    Revision best_revision;
    size_t best_stored_at = 0;

    for (const auto& [id, ref] : index.entries()) {
        if (id.size() < 2 || id.front() != rule.family || id == rule.alias) continue;
        const std::string& version = id.back();
        if (!rule.accepts(version)) continue;

        Revision candidate = parse_revision_or_lowest(version);
        const size_t stored_at = index.stored_at(id);
        if (!best || candidate > best_revision || (candidate == best_revision && stored_at > best_stored_at)) {
            best = &ref;
            best_id = &id;
            best_revision = std::move(candidate);
            best_stored_at = stored_at;
        }
    }

    if (!best) {
        log_debug(string_format("debug.alias_without_candidates", render_identifier(rule.alias)));
        return;
    }
    log_debug(string_format("debug.alias_assigned", render_identifier(rule.alias), render_identifier(*best_id)));
    const ArtifactRef chosen = *best;
    index.assign(rule.alias, chosen);
}

const std::vector<AliasRule>& default_alias_rules() {
    static const std::vector<AliasRule> rules = {
        {"cmdline-tools", {"cmdline-tools", "latest"},
         [](std::string_view v) { return v != "latest" && is_numeric_dotted(v); }},
        {"platform-tools", {"platform-tools"}, [](std::string_view) { return true; }},
        {"tools", {"tools"}, [](std::string_view) { return true; }},
        // Release tags such as r25b name the same artifacts as the numeric revisions
        {"ndk-bundle", {"ndk-bundle"}, [](std::string_view v) { return is_numeric_dotted(v); }},
    };
    return rules;
}

PackageIndex build_package_index(const Manifest& manifest) {
    PackageIndex index;
    size_t accepted = 0;

    for (const auto& [url, entries] : manifest) {
        const std::optional<PackageFamily> family = classify_url(url);
        if (!family) {
            log_debug(string_format("debug.unclassified_url", url));
            continue;
        }

        const size_t count = family_reads_first_entry_only(*family) ? std::min<size_t>(1, entries.size()) : entries.size();
        for (size_t i = 0; i < count; ++i) {
            const ManifestEntry& entry = entries[i];
            try {
                std::optional<NormalizedEntry> normalized = normalize_entry(*family, entry);
                if (!normalized) {
                    log_debug(string_format("debug.entry_skipped", std::string(family_name(*family)), url));
                    continue;
                }

                const ArtifactRef ref{url, normalized->revision, entry.sha256};
                index.offer(normalized->identifier, ref);
                for (const auto& alias : normalized->aliases) {
                    index.offer(alias, ref);
                }
                if (normalized->ndk_release) {
                    index.record_ndk_release(normalized->ndk_release->first, normalized->ndk_release->second);
                }
                ++accepted;
            } catch (const SdkmException& e) {
                log_warning(string_format("warning.entry_rejected", url, e.what()));
            }
        }
    }

    for (const auto& rule : default_alias_rules()) {
        apply_alias_rule(index, rule);
    }

    log_debug(string_format("debug.index_built", accepted, index.size()));
    return index;
}
