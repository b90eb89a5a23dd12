#pragma once

#include <filesystem>
#include <string>

namespace SSD::Storage {

inline constexpr const char* kDefaultContentType = "application/octet-stream";

// EN: MIME type for a file extension (".html", "CSS"...). The leading dot is optional and case is ignored.
//     Unknown extensions map to application/octet-stream.
// FR: Type MIME d'une extension (".html", "CSS"...). Le point initial est optionnel et la casse ignorée.
//     Les extensions inconnues donnent application/octet-stream.
std::string contentTypeForExtension(const std::string& extension);

std::string contentTypeForPath(const std::filesystem::path& path);

} // namespace SSD::Storage
