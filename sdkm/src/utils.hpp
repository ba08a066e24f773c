#pragma once

#include "exception.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Log functions
void log_debug(std::string_view msg);
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Replaces the terminal writer. Pass an empty function to restore it.
using LogSink = std::function<void(LogLevel, std::string_view)>;
void set_log_sink(LogSink sink);

void set_verbose_mode(bool enable);
bool get_verbose_mode();

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::vector<std::string> read_lines_from_file(const fs::path& path);
void remove_if_exists(const fs::path& path);

// Joins a relative archive member name onto root, rejecting absolute names
// and any ".." component.
fs::path validate_path(const fs::path& path, const fs::path& root);

// True when the resolved location of path lies inside root.
bool is_contained_in(const fs::path& path, const fs::path& root);

// Owns a freshly created unique directory and removes it on destruction.
class StagingDir {
public:
    explicit StagingDir(const fs::path& parent, std::string_view prefix = ".sdkm-");
    ~StagingDir();
    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};
