#pragma once

#include "archive.hpp"
#include "manifest.hpp"
#include "package_index.hpp"
#include "version.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Target directory of an identifier under sdk_root, from the per-family
// layout table. NDK release tags are mapped to the concrete revision the
// index knows for them. Throws MissingPackage for families with no layout.
fs::path install_dir_for(const PackageIdentifier& id, const PackageIndex& index, const fs::path& sdk_root);

// Families that never get a package.xml.
bool writes_package_xml(const PackageIdentifier& id);

// Path attribute written into package.xml.
std::string package_xml_path(const PackageIdentifier& id, const Revision& revision);

std::string render_package_xml(const PackageIdentifier& id, const Revision& revision, const std::string& license_text);
void write_package_xml(const fs::path& install_dir, const PackageIdentifier& id, const Revision& revision);

enum class InstallStatus {
    Installed,
    AlreadyPresent
};

// Installs one cached archive into install_dir. The archive must already be
// downloaded and verified; it is deleted once the install succeeds or the
// container turns out to be unreadable.
class InstallationTask {
public:
    InstallationTask(PackageIdentifier id, Revision revision, fs::path archive_path, fs::path install_dir);
    InstallStatus run();

    const ExtractionReport& report() const { return report_; }

private:
    void extract_to_staging(const fs::path& staging);
    void move_into_place(const fs::path& staging);
    void write_metadata();

    PackageIdentifier id_;
    Revision revision_;
    fs::path archive_path_;
    fs::path install_dir_;
    ExtractionReport report_;
};

// Removes the install directory; returns false when nothing was installed.
bool uninstall_package(const fs::path& install_dir);
