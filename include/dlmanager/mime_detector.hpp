#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dlmanager {

struct MimeType {
    std::string mime;
    std::string extension;
};

// Number of leading bytes that covers every known signature.
inline constexpr std::size_t kMimeSniffLength = 262;

[[nodiscard]] std::optional<MimeType> detectMimeType(const std::vector<std::uint8_t>& bytes);
[[nodiscard]] std::optional<MimeType> detectMimeType(const std::filesystem::path& file);
[[nodiscard]] std::optional<MimeType> mimeTypeForExtension(const std::string& extension);

} // namespace dlmanager
