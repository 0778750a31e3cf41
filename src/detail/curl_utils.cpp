#include "dlmanager/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <mutex>

namespace dlmanager::detail {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

struct CurlFree {
    void operator()(char* ptr) const noexcept { curl_free(ptr); }
};

std::string urlPart(CURLU* url, CURLUPart part, unsigned int flags = 0) {
    char* raw = nullptr;
    if (curl_url_get(url, part, &raw, flags) != CURLUE_OK || raw == nullptr) {
        return {};
    }
    std::unique_ptr<char, CurlFree> owned(raw);
    return std::string(owned.get());
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::optional<UrlParts> parseUrl(const std::string& url) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        return std::nullopt;
    }
    // Without a default scheme curl refuses scheme-less input instead of guessing.
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = urlPart(handle.get(), CURLUPART_SCHEME);
    parts.host = urlPart(handle.get(), CURLUPART_HOST);
    parts.path = urlPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE);
    return parts;
}

std::string lastPathSegment(const std::string& url) {
    const auto parts = parseUrl(url);
    if (!parts) {
        return {};
    }
    std::string path = parts->path;
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace dlmanager::detail
