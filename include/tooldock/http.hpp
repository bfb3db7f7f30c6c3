#ifndef TOOLDOCK_HTTP_HPP
#define TOOLDOCK_HTTP_HPP

#include <curl/curl.h>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace tooldock {

class HTTP {
public:
    using ProgressCallback = std::function<void(size_t current, size_t total)>;

    // Throws std::runtime_error carrying the cURL/HTTP failure.
    static void download(const std::string& url, const std::filesystem::path& filepath,
                         ProgressCallback callback = nullptr);

private:
    static size_t fileWriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);
};

class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Retrieves url into dest. Throws on any transfer failure.
    virtual void fetch(const std::string& url, const std::filesystem::path& dest) = 0;
};

class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(HTTP::ProgressCallback callback = nullptr)
        : callback_(std::move(callback)) {}

    void fetch(const std::string& url, const std::filesystem::path& dest) override;

private:
    HTTP::ProgressCallback callback_;
};

} // namespace tooldock

#endif // TOOLDOCK_HTTP_HPP
