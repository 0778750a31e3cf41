#pragma once

#include <optional>
#include <string>

namespace dlmanager::detail {

void ensureCurlInitialized();

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string path;
};

// Parses with libcurl's URL API; nullopt when curl rejects the URL.
[[nodiscard]] std::optional<UrlParts> parseUrl(const std::string& url);

// Last non-empty path segment, percent-decoded; empty when there is none.
[[nodiscard]] std::string lastPathSegment(const std::string& url);

} // namespace dlmanager::detail
