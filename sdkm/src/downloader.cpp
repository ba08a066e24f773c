#include "downloader.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {
    size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
        std::ostream* out = static_cast<std::ostream*>(stream);
        size_t bytes = size * nmemb;
        out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
        return out->good() ? bytes : 0;
    }

    int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
        if (dltotal <= 0) {
            return 0;
        }
        const auto* label = static_cast<const std::string*>(clientp);
        double percentage = static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0;
        log_progress(*label, percentage);
        return 0;
    }

    // Custom deleter for the CURL handle
    struct CurlDeleter {
        void operator()(CURL* curl) const {
            if (curl) {
                curl_easy_cleanup(curl);
            }
        }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

    const std::string USER_AGENT = std::string("sdkm/") + SDKM_VERSION;

    size_t capture_etag(char* buffer, size_t size, size_t nitems, void* userdata) {
        const size_t bytes = size * nitems;
        const std::string_view line(buffer, bytes);
        auto* result = static_cast<DownloadResult*>(userdata);
        // Each response of a redirect chain starts with a status line
        if (line.starts_with("HTTP/")) {
            result->etag.clear();
        } else if (auto etag = parse_etag_header(line)) {
            result->etag = std::move(*etag);
        }
        return bytes;
    }

    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const {
            curl_slist_free_all(list);
        }
    };
    using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;
}

std::optional<std::string> parse_etag_header(std::string_view line) {
    constexpr std::string_view NAME = "etag:";
    if (line.size() < NAME.size()) return std::nullopt;
    for (size_t i = 0; i < NAME.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != NAME[i]) return std::nullopt;
    }
    std::string_view value = line.substr(NAME.size());
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) value.remove_suffix(1);
    if (value.empty()) return std::nullopt;
    return std::string(value);
}

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw SdkmException(get_string("error.curl_init_failed"));
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

DownloadResult download_file(const std::string& url, const fs::path& output_path, bool show_progress, const std::string& etag) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw IOFailure(string_format("error.download_failed", url));
    }

    std::ofstream ofile(output_path, std::ios::binary);
    if (!ofile) {
        throw IOFailure(string_format("error.create_file_failed", output_path.string()));
    }

    const std::string label = string_format("info.downloading", output_path.filename().string());
    log_info(string_format("info.downloading_from", url));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofile);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    // Abort stalled transfers: under 1 KiB/s for a minute
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, 60L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT.c_str());

    DownloadResult result;
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, capture_etag);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &result);
    CurlSlist headers;
    if (!etag.empty()) {
        headers.reset(curl_slist_append(nullptr, ("If-None-Match: " + etag).c_str()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (show_progress) {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &label);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (show_progress && isatty(STDOUT_FILENO)) {
        std::cout << std::endl;
    }

    if (res != CURLE_OK) {
        throw IOFailure(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
    ofile.close();
    if (!ofile) {
        throw IOFailure(string_format("error.write_file_failed", output_path.string()));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status == 304) {
        result.not_modified = true;
        remove_if_exists(output_path);
        log_debug(string_format("debug.not_modified", url));
    }
    return result;
}

DownloadResult download_with_retries(const std::string& url, const fs::path& output_path, int max_retries, bool show_progress,
                                     const std::string& etag) {
    std::chrono::seconds delay(1);
    for (int i = 0; i < max_retries; ++i) {
        try {
            return download_file(url, output_path, show_progress, etag);
        } catch (const IOFailure& e) {
            std::error_code ec;
            fs::remove(output_path, ec); // Clean up failed download
            if (i < max_retries - 1) {
                log_warning(string_format("warning.download_retry", e.what(), delay.count()));
                std::this_thread::sleep_for(delay);
                delay *= 2;
            } else {
                throw; // Rethrow on last attempt
            }
        }
    }
    throw IOFailure(string_format("error.download_failed", url));
}
