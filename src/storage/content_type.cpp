// EN: Extension to MIME type table used for blob uploads.
// FR: Table extension vers type MIME utilisée pour l'envoi des blobs.

#include "storage/content_type.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace SSD::Storage {

namespace {

const std::unordered_map<std::string, std::string>& contentTypes() {
    static const std::unordered_map<std::string, std::string> table = {
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".mjs", "application/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".txt", "text/plain"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".ico", "image/x-icon"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
        {".eot", "application/vnd.ms-fontobject"},
        {".otf", "font/otf"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".ogg", "audio/ogg"},
    };
    return table;
}

} // namespace

std::string contentTypeForExtension(const std::string& extension) {
    if (extension.empty()) {
        return kDefaultContentType;
    }
    std::string key = extension.front() == '.' ? extension : "." + extension;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = contentTypes();
    auto it = table.find(key);
    return it != table.end() ? it->second : kDefaultContentType;
}

std::string contentTypeForPath(const std::filesystem::path& path) {
    return contentTypeForExtension(path.extension().string());
}

} // namespace SSD::Storage
