#include "package_manager.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <array>
#include <format>
#include <fstream>
#include <map>
#include <vector>

namespace {
    // {revision} is replaced by the last identifier segment
    const std::map<std::string, std::string, std::less<>> INSTALL_DIRS = {
        {"build-tools", "build-tools/{revision}"},
        {"cmake", "cmake/{revision}"},
        {"cmdline-tools", "cmdline-tools/{revision}"},
        {"emulator", "emulator"},
        {"ndk", "ndk/{revision}"},
        {"ndk-bundle", "ndk-bundle"},
        {"platforms", "platforms/{revision}"},
        {"platform-tools", "platform-tools"},
        {"skiaparser", "skiaparser/{revision}"},
        {"tools", "tools"},
        {"extras;android;m2repository", "extras/android/m2repository"},
    };

    constexpr std::string_view REVISION_PLACEHOLDER = "{revision}";

    constexpr std::string_view PACKAGE_XML_TEMPLATE =
        R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<ns2:repository
    xmlns:ns2="http://schemas.android.com/repository/android/common/01"
    xmlns:ns3="http://schemas.android.com/repository/android/generic/01"
    xmlns:ns4="http://schemas.android.com/sdk/android/repo/addon2/01"
    xmlns:ns5="http://schemas.android.com/sdk/android/repo/repository2/01"
    xmlns:ns6="http://schemas.android.com/sdk/android/repo/sys-img2/01">
  <license id="{0}" type="text">{1}</license>
  <localPackage path="{2}">
    <type-details xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance" xsi:type="ns3:genericDetailsType"/>
    <revision>{3}</revision>
    <display-name>PLACEHOLDER</display-name>
    <uses-license ref="{0}"/>
  </localPackage>
</ns2:repository>)";

    std::string xml_escape(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                default: out += c;
            }
        }
        return out;
    }

    std::string render_revision_elements(const Revision& revision) {
        static constexpr std::array<std::string_view, 3> TAGS = {"major", "minor", "micro"};
        std::string out;
        for (size_t i = 0; i < revision.numbers.size() && i < TAGS.size(); ++i) {
            out += std::format("<{0}>{1}</{0}>", TAGS[i], revision.numbers[i]);
        }
        return out;
    }
}

fs::path install_dir_for(const PackageIdentifier& id, const PackageIndex& index, const fs::path& sdk_root) {
    if (id.empty()) {
        throw MissingPackage(get_string("error.empty_identifier"), "", std::nullopt);
    }

    std::string name = id.front();
    if (name == "extras" && (id.size() == 3 || id.size() == 4)) {
        name = render_identifier(PackageIdentifier(id.begin(), id.begin() + 3));
    }
    auto it = INSTALL_DIRS.find(name);
    if (it == INSTALL_DIRS.end()) {
        throw MissingPackage(string_format("error.no_install_layout", render_identifier(id)), render_identifier(id), std::nullopt);
    }

    std::string layout = it->second;
    if (auto pos = layout.find(REVISION_PLACEHOLDER); pos != std::string::npos) {
        if (id.size() < 2) {
            throw MissingPackage(string_format("error.no_install_layout", render_identifier(id)), render_identifier(id), std::nullopt);
        }
        const std::string revision = id.front() == "ndk" ? index.ndk_revision_for(id.back()) : id.back();
        if (revision.empty() || revision == "." || revision.find('/') != std::string::npos) {
            throw MissingPackage(string_format("error.no_install_layout", render_identifier(id)), render_identifier(id), std::nullopt);
        }
        layout.replace(pos, REVISION_PLACEHOLDER.size(), revision);
    }

    // The revision segment comes from the manifest; keep it from leaving sdk_root
    return validate_path(layout, sdk_root);
}

bool writes_package_xml(const PackageIdentifier& id) {
    if (id.empty()) return false;
    const std::string& base = id.front();
    return base != "extras" && base != "platforms" && base != "sources" && base != "system-images";
}

std::string package_xml_path(const PackageIdentifier& id, const Revision& revision) {
    const std::string& base = id.front();
    if (base == "emulator" || base == "ndk-bundle" || base == "tools") {
        return base;
    }
    if (base == "ndk") {
        std::string path = "ndk;";
        for (size_t i = 0; i < revision.numbers.size(); ++i) {
            if (i > 0) path += '.';
            path += std::to_string(revision.numbers[i]);
        }
        return path;
    }
    return render_identifier(id);
}

std::string render_package_xml(const PackageIdentifier& id, const Revision& revision, const std::string& license_text) {
    return std::format(PACKAGE_XML_TEMPLATE,
                       LICENSE_ID,
                       xml_escape(license_text),
                       xml_escape(package_xml_path(id, revision)),
                       render_revision_elements(revision));
}

void write_package_xml(const fs::path& install_dir, const PackageIdentifier& id, const Revision& revision) {
    const fs::path xml_path = install_dir / "package.xml";
    std::ofstream out(xml_path, std::ios::trunc);
    if (!out) {
        throw IOFailure(string_format("error.create_file_failed", xml_path.string()));
    }
    out << render_package_xml(id, revision, read_license_text());
    if (!out) {
        throw IOFailure(string_format("error.write_file_failed", xml_path.string()));
    }
}

InstallationTask::InstallationTask(PackageIdentifier id, Revision revision, fs::path archive_path, fs::path install_dir)
    : id_(std::move(id)), revision_(std::move(revision)),
      archive_path_(std::move(archive_path)), install_dir_(std::move(install_dir)) {}

InstallStatus InstallationTask::run() {
    if (fs::exists(fs::symlink_status(install_dir_))) {
        log_info(string_format("info.package_already_installed", render_identifier(id_), install_dir_.string()));
        return InstallStatus::AlreadyPresent;
    }

    log_info(string_format("info.installing_package", render_identifier(id_)));
    ensure_dir_exists(install_dir_.parent_path());

    // Staged next to the target so the final move is a rename
    StagingDir staging(install_dir_.parent_path());
    try {
        extract_to_staging(staging.path());
    } catch (const BadArchive&) {
        remove_if_exists(archive_path_);
        throw;
    }

    move_into_place(staging.path());
    remove_if_exists(archive_path_);
    write_metadata();

    log_info(string_format("info.package_installed_successfully", render_identifier(id_), install_dir_.string()));
    return InstallStatus::Installed;
}

void InstallationTask::extract_to_staging(const fs::path& staging) {
    log_info(string_format("info.extracting_to", staging.string()));
    report_ = extract_zip(archive_path_, staging);
    if (!report_.dropped.empty()) {
        log_warning(string_format("warning.entries_dropped", report_.dropped.size(), render_identifier(id_)));
    }
}

void InstallationTask::move_into_place(const fs::path& staging) {
    std::vector<fs::path> entries;
    for (const auto& dir_entry : fs::directory_iterator(staging)) {
        entries.push_back(dir_entry.path());
    }

    std::error_code ec;
    log_info(string_format("info.installing_into", install_dir_.string()));
    if (entries.size() == 1 && fs::is_directory(fs::symlink_status(entries.front()))) {
        // Collapse the wrapper directory most SDK archives carry
        fs::rename(entries.front(), install_dir_, ec);
        if (ec) {
            throw IOFailure(string_format("error.move_failed", entries.front().string(), install_dir_.string(), ec.message()));
        }
        return;
    }

    ensure_dir_exists(install_dir_);
    for (const auto& entry : entries) {
        const fs::path dest = install_dir_ / entry.filename();
        fs::rename(entry, dest, ec);
        if (ec) {
            throw IOFailure(string_format("error.move_failed", entry.string(), dest.string(), ec.message()));
        }
    }
}

void InstallationTask::write_metadata() {
    if (!writes_package_xml(id_)) {
        log_debug(string_format("debug.package_xml_skipped", render_identifier(id_)));
        return;
    }
    write_package_xml(install_dir_, id_, revision_);
}

bool uninstall_package(const fs::path& install_dir) {
    if (!fs::exists(fs::symlink_status(install_dir))) {
        return false;
    }
    std::error_code ec;
    fs::remove_all(install_dir, ec);
    if (ec) {
        throw IOFailure(string_format("error.remove_failed", install_dir.string()) + ": " + ec.message());
    }
    return true;
}
