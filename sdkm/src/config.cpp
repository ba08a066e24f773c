#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    fs::path default_cache_dir() {
        if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
            return fs::path(xdg) / "sdkmanager";
        }
        if (const char* home = std::getenv("HOME"); home && *home) {
            return fs::path(home) / ".cache/sdkmanager";
        }
        return fs::temp_directory_path() / "sdkmanager";
    }

    const std::vector<std::string> DEFAULT_CHECKSUMS_URLS = {
        "https://f-droid.github.io/android-sdk-transparency-log/signed/checksums.json",
        "https://fdroid.gitlab.io/android-sdk-transparency-log/checksums.json",
        "https://raw.githubusercontent.com/f-droid/android-sdk-transparency-log/master/signed/checksums.json",
    };
}

fs::path SDK_ROOT = default_sdk_root();
fs::path CACHE_DIR = default_cache_dir();
fs::path CONFIG_DIR = SDKM_CONF_DIR;
fs::path L10N_DIR = SDKM_L10N_DIR;
fs::path DATA_DIR = SDKM_DATA_DIR;

// Derived paths
fs::path CHECKSUMS_FILE = CACHE_DIR / "checksums.json";
fs::path KEYRING_FILE = fs::path(SDKM_CONF_DIR) / "keyring.gpg";
fs::path MIRROR_CONF = fs::path(SDKM_CONF_DIR) / "mirror.conf";
fs::path LICENSE_FILE = fs::path(SDKM_DATA_DIR) / "android-sdk-license.txt";

fs::path default_sdk_root() {
    // ANDROID_SDK_ROOT is deprecated but still honoured after ANDROID_HOME
    const char* env = std::getenv("ANDROID_HOME");
    if (!env) env = std::getenv("ANDROID_SDK_ROOT");
    if (!env) return "/opt/android-sdk";
    return env;
}

void set_sdk_root(const std::string& sdk_root) {
    SDK_ROOT = fs::path(sdk_root).lexically_normal();
}

void init_sdk_root() {
    if (SDK_ROOT.empty()) {
        throw ConfigurationError(get_string("error.sdk_root_blank"));
    }
    SDK_ROOT = fs::absolute(SDK_ROOT);
    if (SDK_ROOT.filename().empty()) {
        SDK_ROOT = SDK_ROOT.parent_path();
    }
    if (!fs::is_directory(SDK_ROOT.parent_path())) {
        throw ConfigurationError(string_format("error.sdk_root_parent_missing", SDK_ROOT.string()));
    }
    std::error_code ec;
    fs::create_directory(SDK_ROOT, ec);
    if (ec || !fs::is_directory(SDK_ROOT)) {
        throw ConfigurationError(string_format("error.sdk_root_unusable", SDK_ROOT.string()));
    }
}

void set_cache_dir(const fs::path& cache_dir) {
    CACHE_DIR = cache_dir.lexically_normal();
    CHECKSUMS_FILE = CACHE_DIR / "checksums.json";
}

void init_cache_dir() {
    std::error_code ec;
    fs::create_directories(CACHE_DIR, ec);
    if (ec || !fs::is_directory(CACHE_DIR)) {
        throw ConfigurationError(string_format("error.cache_dir_unusable", CACHE_DIR.string()));
    }
    fs::permissions(CACHE_DIR, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        log_warning(string_format("warning.cache_dir_permissions", CACHE_DIR.string(), ec.message()));
    }
}

std::vector<std::string> get_checksums_urls() {
    if (!fs::exists(MIRROR_CONF)) {
        return DEFAULT_CHECKSUMS_URLS;
    }
    std::vector<std::string> urls = read_lines_from_file(MIRROR_CONF);
    if (urls.empty()) {
        throw ConfigurationError(get_string("error.invalid_mirror_config"));
    }
    return urls;
}

std::string read_license_text() {
    std::ifstream file(LICENSE_FILE);
    if (!file.is_open()) {
        throw ConfigurationError(string_format("error.open_file_failed", LICENSE_FILE.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}
