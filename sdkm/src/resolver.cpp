#include "resolver.hpp"
#include "dym.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>

Resolver::Resolver(const PackageIndex& index, fs::path sdk_root)
    : index_(index), sdk_root_(std::move(sdk_root)) {}

std::optional<std::string> Resolver::suggest(const std::string& rendered) const {
    return did_you_mean(rendered, index_.rendered_identifiers());
}

const ArtifactRef& Resolver::resolve(const PackageIdentifier& id) const {
    if (const ArtifactRef* ref = index_.find(id)) {
        return *ref;
    }
    const std::string rendered = render_identifier(id);
    std::optional<std::string> suggestion = suggest(rendered);
    std::string message = string_format("error.package_not_found", rendered);
    if (suggestion) {
        message += " " + string_format("error.did_you_mean", *suggestion);
    }
    throw MissingPackage(message, rendered, std::move(suggestion));
}

fs::path Resolver::install_dir(const PackageIdentifier& id) const {
    return install_dir_for(id, index_, sdk_root_);
}

InstallStatus Resolver::install(const PackageIdentifier& id, const fs::path& archive) const {
    const ArtifactRef& artifact = resolve(id);
    InstallationTask task(id, artifact.revision, archive, install_dir(id));
    return task.run();
}

BatchResult Resolver::install_packages(const std::vector<std::string>& identifiers, ArtifactFetcher& fetcher) const {
    BatchResult result;
    for (const auto& rendered : identifiers) {
        std::string url;
        try {
            const PackageIdentifier id = parse_identifier(rendered);
            const ArtifactRef& artifact = resolve(id);
            url = artifact.url;
            const fs::path target = install_dir(id);
            if (fs::exists(fs::symlink_status(target))) {
                log_info(string_format("info.package_already_installed", rendered, target.string()));
                result.already_present.push_back(rendered);
                continue;
            }

            const fs::path archive = fetcher.fetch(artifact);
            InstallationTask task(id, artifact.revision, archive, target);
            if (task.run() == InstallStatus::Installed) {
                result.installed.push_back(rendered);
            } else {
                result.already_present.push_back(rendered);
            }
        } catch (const ConfigurationError&) {
            throw;
        } catch (const BadArchive& e) {
            const std::string message = string_format("error.corrupt_download", url, std::string(e.what()));
            log_error(message);
            result.failed.push_back({rendered, message});
        } catch (const SdkmException& e) {
            log_error(e.what());
            result.failed.push_back({rendered, e.what()});
        }
    }
    return result;
}

bool Resolver::uninstall(const PackageIdentifier& id) const {
    const fs::path target = install_dir(id);
    if (!uninstall_package(target)) {
        log_warning(string_format("warning.package_not_installed", render_identifier(id)));
        return false;
    }
    log_info(string_format("info.package_removed", render_identifier(id), target.string()));
    return true;
}

std::vector<std::string> Resolver::list() const {
    std::vector<std::string> names = index_.rendered_identifiers();
    std::sort(names.begin(), names.end());
    return names;
}
