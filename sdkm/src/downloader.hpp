#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Process-wide libcurl setup; construct one in main before any download.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

struct DownloadResult {
    // The server answered 304 to If-None-Match; output_path was not written.
    bool not_modified = false;
    std::string etag; // empty when the response carried none
};

// Value of an "ETag:" response header line, matched case-insensitively.
std::optional<std::string> parse_etag_header(std::string_view line);

// A non-empty etag is sent as If-None-Match.
DownloadResult download_file(const std::string& url, const fs::path& output_path, bool show_progress = true,
                             const std::string& etag = "");

// Retries with exponential backoff starting at one second. The partial file
// is removed after every failed attempt.
DownloadResult download_with_retries(const std::string& url, const fs::path& output_path, int max_retries = 3,
                                     bool show_progress = true, const std::string& etag = "");
