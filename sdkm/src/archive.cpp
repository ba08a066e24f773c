#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <iterator>
#include <memory>
#include <sys/stat.h>
#include <vector>

namespace {
    // Custom deleters for libarchive handles
    struct ArchiveReadDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_read_close(a);
                archive_read_free(a);
            }
        }
    };

    struct ArchiveWriteDeleter {
        void operator()(struct archive* a) const {
            if (a) {
                archive_write_close(a);
                archive_write_free(a);
            }
        }
    };

    using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
    using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

    std::string archive_error(struct archive* a) {
        const char* msg = archive_error_string(a);
        return msg ? msg : get_string("error.archive_unknown");
    }

    void drop_entry(ExtractionReport& report, const std::string& name, const std::string& target, const std::string& reason) {
        if (target.empty()) {
            log_warning(string_format("warning.entry_dropped", name, reason));
        } else {
            log_warning(string_format("warning.symlink_dropped", name, target));
        }
        report.dropped.push_back({name, target, reason});
    }

    struct KeptSymlink {
        std::string name;
        fs::path dest;
        std::string target;
    };

    bool resolves_inside(const fs::path& link, const fs::path& output_dir) {
        try {
            return is_contained_in(link, output_dir);
        } catch (const IOFailure& e) {
            log_debug(e.what());
            return false;
        }
    }

    // Recreates a symlink member by hand and keeps it only when it resolves
    // inside output_dir. Returns true when the link was kept.
    bool extract_symlink(const std::string& name, const fs::path& dest, const std::string& target,
                         const fs::path& output_dir, ExtractionReport& report) {
        std::error_code ec;
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            throw IOFailure(string_format("error.create_dir_failed", dest.parent_path().string()) + ": " + ec.message());
        }
        if (!is_contained_in(dest.parent_path(), output_dir)) {
            drop_entry(report, name, "", get_string("reason.parent_escapes"));
            return false;
        }
        fs::remove(dest, ec);
        fs::create_symlink(target, dest, ec);
        if (ec) {
            throw IOFailure(string_format("error.create_symlink_failed", dest.string(), ec.message()));
        }

        if (!resolves_inside(dest, output_dir)) {
            remove_if_exists(dest);
            drop_entry(report, name, target, get_string("reason.symlink_escapes"));
            return false;
        }
        ++report.extracted;
        report.top_levels.insert(fs::path(name).lexically_normal().begin()->string());
        return true;
    }

    // A link that dangled when it was checked can be redirected by a later
    // member ("c -> d/.." followed by "d -> ."), so every kept link is
    // checked again once the archive is fully written. Repeats until no link
    // is removed.
    void recheck_symlinks(std::vector<KeptSymlink>& links, const fs::path& output_dir, ExtractionReport& report) {
        bool removed = true;
        while (removed) {
            removed = false;
            for (auto it = links.begin(); it != links.end();) {
                if (resolves_inside(it->dest, output_dir)) {
                    ++it;
                    continue;
                }
                remove_if_exists(it->dest);
                drop_entry(report, it->name, it->target, get_string("reason.symlink_escapes"));
                --report.extracted;
                const fs::path relative = fs::path(it->name).lexically_normal();
                if (std::distance(relative.begin(), relative.end()) == 1) {
                    report.top_levels.erase(relative.string());
                }
                it = links.erase(it);
                removed = true;
            }
        }
    }
}

ExtractionReport extract_zip(const fs::path& archive_path, const fs::path& output_dir) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_format_zip(a.get());

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                              ARCHIVE_EXTRACT_SECURE_SYMLINKS | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                              ARCHIVE_EXTRACT_UNLINK);

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw BadArchive(string_format("error.bad_archive", archive_path.string(), archive_error(a.get())), archive_path.string());
    }

    ExtractionReport report;
    std::vector<KeptSymlink> symlinks;
    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* raw_name = archive_entry_pathname(entry);
        std::string name = raw_name ? raw_name : "";
        while (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        if (name.empty()) continue;

        fs::path dest;
        try {
            dest = validate_path(name, output_dir);
        } catch (const SdkmException& e) {
            drop_entry(report, name, "", e.what());
            continue;
        }

        const mode_t type = archive_entry_filetype(entry);
        if (type == AE_IFLNK) {
            const std::string target = archive_entry_symlink(entry) ? archive_entry_symlink(entry) : "";
            if (extract_symlink(name, dest, target, output_dir, report)) {
                symlinks.push_back({name, dest, target});
            }
            continue;
        }
        if (type != AE_IFREG && type != AE_IFDIR) {
            drop_entry(report, name, "", get_string("reason.unsupported_type"));
            continue;
        }

        const bool executable = type == AE_IFDIR || (archive_entry_perm(entry) & S_IXUSR);
        archive_entry_set_perm(entry, executable ? 0755 : 0644);
        archive_entry_set_pathname(entry, dest.c_str());

        r = archive_write_header(ext.get(), entry);
        if (r == ARCHIVE_FATAL) {
            throw IOFailure(string_format("error.extract_failed", name, archive_error(ext.get())));
        }
        if (r < ARCHIVE_WARN) {
            // Refused by the secure-write checks, e.g. a path through a symlink
            drop_entry(report, name, "", archive_error(ext.get()));
            continue;
        }

        const void* buff;
        size_t size;
        la_int64_t offset;
        while ((r = archive_read_data_block(a.get(), &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                throw IOFailure(string_format("error.extract_failed", name, archive_error(ext.get())));
            }
        }
        if (r != ARCHIVE_EOF) {
            throw BadArchive(string_format("error.bad_archive", archive_path.string(), archive_error(a.get())), archive_path.string());
        }
        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            throw IOFailure(string_format("error.extract_failed", name, archive_error(ext.get())));
        }

        report.top_levels.insert(fs::path(name).lexically_normal().begin()->string());
        if (++report.extracted % 1000 == 0) {
            log_debug(string_format("debug.extracting", report.extracted));
        }
    }

    if (r != ARCHIVE_EOF) {
        throw BadArchive(string_format("error.bad_archive", archive_path.string(), archive_error(a.get())), archive_path.string());
    }

    // Directory permissions are applied when the writer closes
    ext.reset();
    recheck_symlinks(symlinks, output_dir, report);

    log_debug(string_format("debug.extract_complete", report.extracted, report.dropped.size()));
    return report;
}
