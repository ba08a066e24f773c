#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <ctime>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

struct ZipMember {
    std::string name;
    std::string content;
    mode_t type = AE_IFREG;
    int perm = 0644;
    std::string link_target;

    static ZipMember file(std::string name, std::string content, int perm = 0644) {
        return {std::move(name), std::move(content), AE_IFREG, perm, ""};
    }
    static ZipMember dir(std::string name) {
        return {std::move(name), "", AE_IFDIR, 0755, ""};
    }
    static ZipMember symlink(std::string name, std::string target) {
        return {std::move(name), "", AE_IFLNK, 0777, std::move(target)};
    }
};

// Writes members into a zip file the way SDK archives are laid out.
inline void write_zip(const fs::path& path, const std::vector<ZipMember>& members) {
    auto closer = [](struct archive* a) {
        archive_write_close(a);
        archive_write_free(a);
    };
    std::unique_ptr<struct archive, decltype(closer)> a(archive_write_new(), closer);
    archive_write_set_format_zip(a.get());
    if (archive_write_open_filename(a.get(), path.c_str()) != ARCHIVE_OK) {
        throw std::runtime_error(archive_error_string(a.get()));
    }

    for (const auto& member : members) {
        std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), &archive_entry_free);
        archive_entry_set_pathname(entry.get(), member.name.c_str());
        archive_entry_set_filetype(entry.get(), member.type);
        archive_entry_set_perm(entry.get(), static_cast<mode_t>(member.perm));
        archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
        if (member.type == AE_IFLNK) {
            archive_entry_set_symlink(entry.get(), member.link_target.c_str());
            archive_entry_set_size(entry.get(), 0);
        } else if (member.type == AE_IFREG) {
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(member.content.size()));
        } else {
            archive_entry_set_size(entry.get(), 0);
        }

        if (archive_write_header(a.get(), entry.get()) < ARCHIVE_WARN) {
            throw std::runtime_error(archive_error_string(a.get()));
        }
        if (member.type == AE_IFREG && !member.content.empty()) {
            archive_write_data(a.get(), member.content.data(), member.content.size());
        }
    }
}
