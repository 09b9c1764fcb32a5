#include "jdki/http.hpp"
#include "jdki/version.hpp"
#include <stdexcept>
#include <fstream>
#include <filesystem>
#include <utility>

namespace jdki {

namespace {

// Owns the easy handle and header list for one transfer.
struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* headers = nullptr;

    ~CurlRequest() {
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
};

} // namespace

HTTP::HTTP(HttpSettings settings) : settings_(std::move(settings)) {
    if (settings_.userAgent.empty()) {
        settings_.userAgent = "jdki/" + JDKI_VERSION_STRING;
    }
}

size_t HTTP::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::string HTTP::get(const std::string& url, const std::vector<std::string>& headers) {
    CurlRequest req;
    if (!req.curl) {
        throw std::runtime_error("Failed to initialize cURL");
    }

    for (const auto& h : headers) {
        req.headers = curl_slist_append(req.headers, h.c_str());
    }

    std::string response;
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(req.curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, settings_.userAgent.c_str());
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, settings_.connectTimeout);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_LIMIT, settings_.lowSpeedLimit);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_TIME, settings_.lowSpeedTime);
    if (req.headers) {
        curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
    }

    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) {
        std::string detail = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res));
        throw std::runtime_error("GET " + url + " failed: " + detail);
    }

    return response;
}

struct ProgressData {
    HTTP::ProgressCallback callback;
};

size_t HTTP::fileWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::ofstream* ofs = static_cast<std::ofstream*>(userp);
    size_t totalSize = size * nmemb;
    ofs->write(static_cast<char*>(contents), totalSize);
    if (!*ofs) return 0; // aborts the transfer with CURLE_WRITE_ERROR
    return totalSize;
}

int HTTP::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                           curl_off_t, curl_off_t) {
    ProgressData* data = static_cast<ProgressData*>(clientp);
    if (data && data->callback && dltotal > 0) {
        data->callback(static_cast<size_t>(dlnow), static_cast<size_t>(dltotal));
    }
    return 0;
}

bool HTTP::download(const std::string& url, const std::string& filepath, ProgressCallback callback) {
    lastError_.clear();
    CurlRequest req;
    if (!req.curl) {
        lastError_ = "Failed to initialize cURL";
        return false;
    }

    std::string partPath = filepath + ".part";
    std::ofstream ofs(partPath, std::ios::binary);
    if (!ofs) {
        lastError_ = "Cannot open " + partPath + " for writing";
        return false;
    }

    ProgressData data{callback};
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, fileWriteCallback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ofs);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(req.curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, settings_.userAgent.c_str());
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, settings_.connectTimeout);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_LIMIT, settings_.lowSpeedLimit);
    curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_TIME, settings_.lowSpeedTime);

    if (callback) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &data);
    }

    CURLcode res = curl_easy_perform(req.curl);
    ofs.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        lastError_ = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(res));
        std::filesystem::remove(partPath, ec);
        return false;
    }

    if (std::filesystem::exists(filepath, ec)) std::filesystem::remove(filepath, ec);
    std::filesystem::rename(partPath, filepath, ec);
    if (ec) {
        lastError_ = "Cannot move " + partPath + " into place: " + ec.message();
        std::filesystem::remove(partPath, ec);
        return false;
    }
    return true;
}

} // namespace jdki
