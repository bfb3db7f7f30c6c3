#include "tooldock/http.hpp"
#include "tooldock/errors.hpp"
#include "tooldock/logger.hpp"
#include "tooldock/version.hpp"
#include <fstream>
#include <memory>
#include <stdexcept>

namespace tooldock {

namespace {

const std::string USER_AGENT = "tooldock/" + TOOLDOCK_VERSION_STRING;

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

CurlHandle makeHandle(const std::string& url) {
    static const CURLcode globalInit = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (globalInit != CURLE_OK) {
        throw std::runtime_error("Failed to initialize cURL: " +
                                 std::string(curl_easy_strerror(globalInit)));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize cURL");
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT.c_str());
    return curl;
}

std::string describeFailure(CURL* curl, CURLcode res) {
    std::string msg = "cURL request failed: " + std::string(curl_easy_strerror(res));
    if (res == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        msg += " (HTTP " + std::to_string(status) + ")";
    }
    return msg;
}

} // namespace

struct ProgressData {
    HTTP::ProgressCallback callback;
};

size_t HTTP::fileWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::ofstream* ofs = static_cast<std::ofstream*>(userp);
    size_t totalSize = size * nmemb;
    ofs->write(static_cast<char*>(contents), totalSize);
    // a short count makes cURL abort with CURLE_WRITE_ERROR
    return ofs->good() ? totalSize : 0;
}

int HTTP::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                           curl_off_t, curl_off_t) {
    ProgressData* data = static_cast<ProgressData*>(clientp);
    if (data && data->callback && dltotal > 0) {
        data->callback(static_cast<size_t>(dlnow), static_cast<size_t>(dltotal));
    }
    return 0;
}

void HTTP::download(const std::string& url, const std::filesystem::path& filepath,
                    ProgressCallback callback) {
    CurlHandle curl = makeHandle(url);

    std::filesystem::path partPath = filepath;
    partPath += ".part";

    CURLcode res;
    {
        std::ofstream ofs(partPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Unable to open " + partPath.string() + " for writing");
        }

        ProgressData data{callback};

        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, fileWriteCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ofs);
        if (callback) {
            curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &data);
        }

        res = curl_easy_perform(curl.get());
    }

    std::error_code ec;
    if (res != CURLE_OK) {
        std::filesystem::remove(partPath, ec);
        throw std::runtime_error(describeFailure(curl.get(), res));
    }

    std::filesystem::rename(partPath, filepath, ec);
    if (ec) {
        std::filesystem::remove(partPath, ec);
        throw std::runtime_error("Unable to move download into place at " + filepath.string());
    }
}

void HttpFetcher::fetch(const std::string& url, const std::filesystem::path& dest) {
    LOG_INFO("Fetching " + url + " -> " + dest.string());
    try {
        HTTP::download(url, dest, callback_);
    } catch (const std::exception& e) {
        throw InstallationError("Unable to download '" + url + "'", e);
    }
    LOG_DEBUG("Fetched " + url);
}

} // namespace tooldock
