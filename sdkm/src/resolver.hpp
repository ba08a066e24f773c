#pragma once

#include "fetcher.hpp"
#include "package_index.hpp"
#include "package_manager.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct PackageFailure {
    std::string identifier;
    std::string message;
};

struct BatchResult {
    std::vector<std::string> installed;
    std::vector<std::string> already_present;
    std::vector<PackageFailure> failed;

    bool ok() const { return failed.empty(); }
};

// Answers identifier lookups against one index and installs into sdk_root.
class Resolver {
public:
    Resolver(const PackageIndex& index, fs::path sdk_root);

    // Throws MissingPackage, with a close match as suggestion when one exists.
    const ArtifactRef& resolve(const PackageIdentifier& id) const;
    std::optional<std::string> suggest(const std::string& rendered) const;

    fs::path install_dir(const PackageIdentifier& id) const;

    // Installs a cached, verified archive for id.
    InstallStatus install(const PackageIdentifier& id, const fs::path& archive) const;

    // Installs each package in order, fetching archives on demand. A
    // ConfigurationError aborts the batch; other failures are recorded and
    // the next package is attempted.
    BatchResult install_packages(const std::vector<std::string>& identifiers, ArtifactFetcher& fetcher) const;

    // Returns false when the package was not installed.
    bool uninstall(const PackageIdentifier& id) const;

    // Every rendered identifier, sorted.
    std::vector<std::string> list() const;

private:
    const PackageIndex& index_;
    fs::path sdk_root_;
};
