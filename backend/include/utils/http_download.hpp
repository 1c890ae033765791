#pragma once

#include <string>

namespace soksak {
namespace utils {

/**
 * Fetches a remote resource into a local file.
 */
class FileDownloader {
public:
    virtual ~FileDownloader() = default;

    /**
     * Download url to destination. The destination only appears once the
     * transfer has completed. Throws std::runtime_error on failure.
     */
    virtual void download(const std::string& url, const std::string& destination) = 0;
};

/**
 * libcurl-backed downloader. Holds a reference on the process-wide curl
 * initialization for its lifetime.
 */
class HttpDownloader : public FileDownloader {
public:
    explicit HttpDownloader(long connectTimeoutSeconds = 30);
    ~HttpDownloader() override;

    HttpDownloader(const HttpDownloader&) = delete;
    HttpDownloader& operator=(const HttpDownloader&) = delete;

    void download(const std::string& url, const std::string& destination) override;

private:
    long connectTimeoutSeconds_;
    bool curlGlobalAcquired_;
};

} // namespace utils
} // namespace soksak
