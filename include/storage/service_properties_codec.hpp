#pragma once

#include "storage/blob_storage_client.hpp"

#include <stdexcept>
#include <string>

namespace SSD::Storage {

class ServicePropertiesFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// EN: Codec for the StorageServiceProperties XML document.
// FR: Codec du document XML StorageServiceProperties.
namespace ServicePropertiesCodec {

    // EN: Throws ServicePropertiesFormatError on a malformed document.
    // FR: Lève ServicePropertiesFormatError si le document est mal formé.
    ServiceProperties parse(const std::string& xml);

    std::string serialize(const ServiceProperties& properties);

    std::string escapeXml(const std::string& text);
    std::string unescapeXml(const std::string& text);

} // namespace ServicePropertiesCodec

} // namespace SSD::Storage
