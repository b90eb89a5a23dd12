#pragma once

#include "infrastructure/threading/cancellation.hpp"

#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace SSD::Storage {

// EN: Static website hosting settings of a storage account.
// FR: Paramètres d'hébergement de site statique d'un compte de stockage.
struct StaticWebsiteProperties {
    bool enabled = false;
    std::string index_document;
    std::string error_document_404_path;
    std::string default_index_document_path;

    bool operator==(const StaticWebsiteProperties& other) const {
        return enabled == other.enabled && index_document == other.index_document &&
               error_document_404_path == other.error_document_404_path &&
               default_index_document_path == other.default_index_document_path;
    }
};

// EN: Service-level properties. Only the static website part is modelled; every other
//     top-level element is carried verbatim so a read-modify-write leaves it untouched.
// FR: Propriétés du service. Seule la partie site statique est modélisée ; les autres éléments
//     de premier niveau sont conservés tels quels pour qu'une lecture-modification-écriture ne les touche pas.
struct ServiceProperties {
    struct RawElement {
        std::string name;
        std::string xml;
    };

    StaticWebsiteProperties static_website;
    std::vector<RawElement> preserved_elements;

    // EN: Index of the static website element among the preserved ones (appended when absent).
    // FR: Position de l'élément site statique parmi les éléments conservés (ajouté à la fin si absent).
    size_t static_website_position = static_cast<size_t>(-1);
};

// EN: Object-storage operations used by the deployment. Every call runs asynchronously.
// FR: Opérations de stockage objet utilisées par le déploiement. Chaque appel est asynchrone.
class IBlobStorageClient {
public:
    virtual ~IBlobStorageClient() = default;

    virtual std::future<ServiceProperties> getServiceProperties(const CancellationToken& token) = 0;
    virtual std::future<void> setServiceProperties(const ServiceProperties& properties,
                                                   const CancellationToken& token) = 0;

    // EN: Resolves to true when the container was created, false when it already existed.
    // FR: Vaut true si le conteneur a été créé, false s'il existait déjà.
    virtual std::future<bool> createContainerIfNotExists(const std::string& container,
                                                         const CancellationToken& token) = 0;

    virtual std::future<void> uploadBlob(const std::string& container, const std::string& blob_name,
                                         const std::filesystem::path& file_path,
                                         const std::string& content_type,
                                         const CancellationToken& token) = 0;
};

// EN: Creates a client bound to a resolved blob endpoint.
// FR: Crée un client lié à un endpoint blob résolu.
using StorageClientFactory = std::function<std::shared_ptr<IBlobStorageClient>(const std::string& endpoint)>;

} // namespace SSD::Storage
