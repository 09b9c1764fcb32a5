#ifndef JDKI_HTTP_HPP
#define JDKI_HTTP_HPP

#include <string>
#include <curl/curl.h>
#include <functional>
#include <vector>

namespace jdki {

struct HttpSettings {
    std::string userAgent;
    long connectTimeout = 30;   // seconds
    long lowSpeedTime = 60;     // seconds below lowSpeedLimit before abort
    long lowSpeedLimit = 1;     // bytes per second
};

// Blocking libcurl transport. Virtual so the resolver and acquirer can be
// driven by a fake in tests.
class HTTP {
public:
    using ProgressCallback = std::function<void(size_t current, size_t total)>;

    explicit HTTP(HttpSettings settings = {});
    virtual ~HTTP() = default;

    // Throws std::runtime_error on transport failure or a non-2xx status.
    virtual std::string get(const std::string& url,
                            const std::vector<std::string>& headers = {});

    // Writes to <filepath>.part and renames on success. Returns false on
    // failure, with no file left behind.
    virtual bool download(const std::string& url, const std::string& filepath,
                          ProgressCallback callback = nullptr);

    const std::string& lastError() const { return lastError_; }

protected:
    std::string lastError_;

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t fileWriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);

    HttpSettings settings_;
};

} // namespace jdki

#endif // JDKI_HTTP_HPP
