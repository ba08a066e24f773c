#pragma once

#include <filesystem>
#include <string>
#include <vector>

// Global paths (initialized to defaults, overridden from the command line)
extern std::filesystem::path SDK_ROOT;
extern std::filesystem::path CACHE_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path L10N_DIR;
extern std::filesystem::path DATA_DIR;

// Derived paths
extern std::filesystem::path CHECKSUMS_FILE;
extern std::filesystem::path KEYRING_FILE;
extern std::filesystem::path MIRROR_CONF;
extern std::filesystem::path LICENSE_FILE;

inline constexpr const char* SDKM_VERSION = "25.2.0";
inline constexpr const char* LICENSE_ID = "android-sdk-license";

// Functions
std::filesystem::path default_sdk_root();
void set_sdk_root(const std::string& sdk_root);
void init_sdk_root();
void set_cache_dir(const std::filesystem::path& cache_dir);
void init_cache_dir();
std::vector<std::string> get_checksums_urls();
std::string read_license_text();
