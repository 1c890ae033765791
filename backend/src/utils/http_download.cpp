#include "utils/http_download.hpp"
#include "utils/logging.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace soksak {
namespace utils {

namespace {

std::mutex g_curlMutex;
int g_curlRefcount = 0;

bool acquireCurlGlobal() {
    std::lock_guard<std::mutex> lock(g_curlMutex);
    if (g_curlRefcount == 0) {
        CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (result != CURLE_OK) {
            Logger::error("curl_global_init failed: " + std::string(curl_easy_strerror(result)));
            return false;
        }
    }
    ++g_curlRefcount;
    return true;
}

void releaseCurlGlobal() {
    std::lock_guard<std::mutex> lock(g_curlMutex);
    if (g_curlRefcount <= 0) {
        return;
    }
    if (--g_curlRefcount == 0) {
        curl_global_cleanup();
    }
}

size_t writeToFile(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<std::FILE*>(userp));
}

} // namespace

HttpDownloader::HttpDownloader(long connectTimeoutSeconds)
    : connectTimeoutSeconds_(connectTimeoutSeconds)
    , curlGlobalAcquired_(acquireCurlGlobal()) {
}

HttpDownloader::~HttpDownloader() {
    if (curlGlobalAcquired_) {
        releaseCurlGlobal();
    }
}

void HttpDownloader::download(const std::string& url, const std::string& destination) {
    if (!curlGlobalAcquired_) {
        throw std::runtime_error("libcurl is not initialized");
    }

    std::filesystem::path target(destination);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + target.parent_path().string() +
                                     ": " + ec.message());
        }
    }

    std::string partial = destination + ".part";
    std::FILE* out = std::fopen(partial.c_str(), "wb");
    if (!out) {
        throw std::runtime_error("Cannot open " + partial + " for writing");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(out);
        std::remove(partial.c_str());
        throw std::runtime_error("Failed to initialize curl");
    }

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToFile);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, out);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);

    Logger::info("Downloading " + url);
    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_easy_cleanup(curl);

    bool closed = std::fclose(out) == 0;

    if (res != CURLE_OK || !closed) {
        std::remove(partial.c_str());
        std::string reason = res != CURLE_OK
            ? (errorBuffer[0] ? std::string(errorBuffer) : std::string(curl_easy_strerror(res)))
            : std::string("write error");
        throw std::runtime_error("Download of " + url + " failed (HTTP " +
                                 std::to_string(httpCode) + "): " + reason);
    }

    std::error_code ec;
    std::filesystem::rename(partial, target, ec);
    if (ec) {
        std::remove(partial.c_str());
        throw std::runtime_error("Cannot move download into place at " + destination + ": " + ec.message());
    }

    Logger::info("Downloaded " + url + " to " + destination);
}

} // namespace utils
} // namespace soksak
