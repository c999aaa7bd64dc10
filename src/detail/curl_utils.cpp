#include "retriever/detail/curl_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace retriever::detail {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FileHandle = std::unique_ptr<FILE, FileDeleter>;
using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* file = static_cast<FILE*>(userdata);
    if (!file) {
        return 0;
    }
    return std::fwrite(ptr, size, nmemb, file) * size;
}

} // namespace

// Must run before any worker thread creates an easy handle;
// curl_global_init is not thread-safe.
void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error(std::string{"libcurl initialization failed: "} +
                                     curl_easy_strerror(code));
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

int fetchToFile(const std::string& url, const std::filesystem::path& destination) {
    FileHandle file{std::fopen(destination.c_str(), "wb")};
    if (!file) {
        return CURLE_WRITE_ERROR;
    }

    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return CURLE_FAILED_INIT;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeToFile);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OK && std::fflush(file.get()) != 0) {
        res = CURLE_WRITE_ERROR;
    }
    return static_cast<int>(res);
}

} // namespace retriever::detail
