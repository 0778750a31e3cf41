#include "dlmanager/mime_detector.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>

namespace dlmanager {

namespace {

using Bytes = std::vector<std::uint8_t>;

bool matchesAt(const Bytes& bytes, std::size_t offset, std::initializer_list<std::uint8_t> signature) {
    if (bytes.size() < offset + signature.size()) {
        return false;
    }
    return std::equal(signature.begin(), signature.end(), bytes.begin() + static_cast<std::ptrdiff_t>(offset));
}

struct Signature {
    const char* mime;
    const char* extension;
    bool (*matches)(const Bytes&);
};

// Checked in order; the first match wins, so more specific entries come first.
const Signature kSignatures[] = {
    {"image/jpeg", "jpg", [](const Bytes& b) { return matchesAt(b, 0, {0xFF, 0xD8, 0xFF}); }},
    {"image/png", "png", [](const Bytes& b) { return matchesAt(b, 0, {0x89, 0x50, 0x4E, 0x47}); }},
    {"image/gif", "gif", [](const Bytes& b) { return matchesAt(b, 0, {0x47, 0x49, 0x46}); }},
    {"image/webp", "webp", [](const Bytes& b) { return matchesAt(b, 8, {0x57, 0x45, 0x42, 0x50}); }},
    {"application/pdf", "pdf", [](const Bytes& b) { return matchesAt(b, 0, {0x25, 0x50, 0x44, 0x46}); }},
    {"application/zip", "zip", [](const Bytes& b) { return matchesAt(b, 0, {0x50, 0x4B, 0x03, 0x04}); }},
    {"video/quicktime", "mov",
     [](const Bytes& b) { return matchesAt(b, 0, {0x00, 0x00, 0x00, 0x14, 0x66, 0x74, 0x79, 0x70}); }},
    {"video/mp4", "mp4", [](const Bytes& b) { return matchesAt(b, 4, {0x66, 0x74, 0x79, 0x70}); }},
    {"audio/mpeg", "mp3",
     [](const Bytes& b) { return matchesAt(b, 0, {0x49, 0x44, 0x33}) || matchesAt(b, 0, {0xFF, 0xFB}); }},
    {"audio/x-wav", "wav", [](const Bytes& b) { return matchesAt(b, 8, {0x57, 0x41, 0x56, 0x45}); }},
    {"video/x-msvideo", "avi",
     [](const Bytes& b) { return matchesAt(b, 0, {0x52, 0x49, 0x46, 0x46}) && matchesAt(b, 8, {0x41, 0x56, 0x49}); }},
    {"audio/ogg", "ogg", [](const Bytes& b) { return matchesAt(b, 0, {0x4F, 0x67, 0x67, 0x53}); }},
    {"application/x-bzip2", "bz2", [](const Bytes& b) { return matchesAt(b, 0, {0x42, 0x5A, 0x68}); }},
    {"application/gzip", "gz", [](const Bytes& b) { return matchesAt(b, 0, {0x1F, 0x8B, 0x08}); }},
    {"application/x-rar-compressed", "rar",
     [](const Bytes& b) { return matchesAt(b, 0, {0x52, 0x61, 0x72, 0x21, 0x1A, 0x07}); }},
    {"application/x-tar", "tar", [](const Bytes& b) { return matchesAt(b, 257, {0x75, 0x73, 0x74, 0x61, 0x72}); }},
    {"audio/flac", "flac", [](const Bytes& b) { return matchesAt(b, 0, {0x66, 0x4C, 0x61, 0x43}); }},
    {"image/tiff", "tif",
     [](const Bytes& b) {
         return matchesAt(b, 0, {0x49, 0x49, 0x2A, 0x00}) || matchesAt(b, 0, {0x4D, 0x4D, 0x00, 0x2A});
     }},
    {"video/x-ms-wmv", "wmv", [](const Bytes& b) { return matchesAt(b, 0, {0x30, 0x26, 0xB2, 0x75}); }},
    {"application/vnd.adobe.photoshop", "psd", [](const Bytes& b) { return matchesAt(b, 0, {0x38, 0x42, 0x50, 0x53}); }},
    {"application/x-msdownload", "exe", [](const Bytes& b) { return matchesAt(b, 0, {0x4D, 0x5A}); }},
    {"application/x-7z-compressed", "7z",
     [](const Bytes& b) { return matchesAt(b, 0, {0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C}); }},
    {"application/x-xz", "xz", [](const Bytes& b) { return matchesAt(b, 0, {0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00}); }},
    {"video/x-flv", "flv", [](const Bytes& b) { return matchesAt(b, 0, {0x46, 0x4C, 0x56, 0x01}); }},
    {"application/x-sqlite3", "sqlite", [](const Bytes& b) { return matchesAt(b, 0, {0x53, 0x51, 0x4C, 0x69}); }},
    {"application/font-woff", "woff", [](const Bytes& b) { return matchesAt(b, 0, {0x77, 0x4F, 0x46, 0x46}); }},
    {"application/font-woff2", "woff2", [](const Bytes& b) { return matchesAt(b, 0, {0x77, 0x4F, 0x46, 0x32}); }},
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

} // namespace

std::optional<MimeType> detectMimeType(const std::vector<std::uint8_t>& bytes) {
    for (const auto& signature : kSignatures) {
        if (signature.matches(bytes)) {
            return MimeType{signature.mime, signature.extension};
        }
    }
    return std::nullopt;
}

std::optional<MimeType> detectMimeType(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::in | std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> bytes(kMimeSniffLength);
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    bytes.resize(static_cast<std::size_t>(in.gcount()));
    return detectMimeType(bytes);
}

std::optional<MimeType> mimeTypeForExtension(const std::string& extension) {
    std::string ext = toLower(extension);
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(ext.begin());
    }
    if (ext == "jpeg") {
        ext = "jpg";
    } else if (ext == "tiff") {
        ext = "tif";
    }
    for (const auto& signature : kSignatures) {
        if (ext == signature.extension) {
            return MimeType{signature.mime, signature.extension};
        }
    }
    return std::nullopt;
}

} // namespace dlmanager
