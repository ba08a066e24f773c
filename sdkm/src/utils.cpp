#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    bool verbose_mode = false;
    std::mutex log_mutex;
    LogSink log_sink;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void check_ttys() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(LogLevel level, std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (log_sink) {
            log_sink(level, msg);
            return;
        }

        check_ttys();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }

    constexpr int MAX_SYMLINK_DEPTH = 40;

    // Like realpath(3) but tolerates a missing final target, so a dangling
    // link still reports where it points.
    fs::path resolve_path(const fs::path& path, int depth) {
        if (depth > MAX_SYMLINK_DEPTH) {
            throw IOFailure(string_format("error.symlink_loop", path.string()));
        }

        std::error_code ec;
        fs::path parent = fs::weakly_canonical(path.parent_path(), ec);
        if (ec) {
            throw IOFailure(string_format("error.resolve_failed", path.string(), ec.message()));
        }
        fs::path leaf = parent / path.filename();

        if (fs::is_symlink(fs::symlink_status(leaf, ec))) {
            fs::path target = fs::read_symlink(leaf, ec);
            if (ec) {
                throw IOFailure(string_format("error.resolve_failed", leaf.string(), ec.message()));
            }
            fs::path next = target.is_absolute() ? target : parent / target;
            return resolve_path(next, depth + 1);
        }
        return leaf.lexically_normal();
    }
}

void log_debug(std::string_view msg) {
    if (!verbose_mode) return;
    log_internal(LogLevel::DEBUG, get_string("debug.prefix") + " ", COLOR_WHITE, msg, std::cout);
}

void log_info(std::string_view msg) {
    log_internal(LogLevel::INFO, get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(LogLevel::WARNING, get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(LogLevel::ERROR, get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_ttys();
        if (log_sink || !is_stdout_tty) {
            return;
        }
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_sink = std::move(sink);
}

void set_verbose_mode(bool enable) {
    verbose_mode = enable;
}

bool get_verbose_mode() {
    return verbose_mode;
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw IOFailure(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw IOFailure(string_format("error.path_not_dir", path.string()));
    }
}

std::vector<std::string> read_lines_from_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IOFailure(string_format("error.open_file_failed", path.string()));
    }
    std::vector<std::string> result;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty() && line[0] != '#') result.push_back(line);
    }
    return result;
}

void remove_if_exists(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw IOFailure(string_format("error.remove_failed", path.string()) + ": " + ec.message());
    }
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw SdkmException(string_format("error.absolute_member_path", path.string()));
    }

    // Checked before normalizing, which would fold "a/.." into "."
    for (const auto& component : path) {
        if (component == "..") {
            throw SdkmException(string_format("error.member_path_traversal", path.string()));
        }
    }
    return root / path.lexically_normal();
}

bool is_contained_in(const fs::path& path, const fs::path& root) {
    std::error_code ec;
    const fs::path canonical_root = fs::canonical(root, ec);
    if (ec) {
        throw IOFailure(string_format("error.resolve_failed", root.string(), ec.message()));
    }

    const fs::path resolved = resolve_path(path, 0);
    auto mismatch = std::mismatch(canonical_root.begin(), canonical_root.end(),
                                  resolved.begin(), resolved.end());
    return mismatch.first == canonical_root.end();
}

StagingDir::StagingDir(const fs::path& parent, std::string_view prefix) {
    ensure_dir_exists(parent);
    std::string templ = (parent / (std::string(prefix) + "XXXXXX")).string();
    if (mkdtemp(templ.data()) == nullptr) {
        throw IOFailure(string_format("error.create_dir_failed", templ) + ": " + std::strerror(errno));
    }
    path_ = templ;
}

StagingDir::~StagingDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warning(string_format("warning.staging_cleanup_failed", path_.string(), ec.message()));
    }
}
