#pragma once

#include "infrastructure/networking/http_client.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "storage/blob_storage_client.hpp"

#include <memory>
#include <string>

namespace SSD {
class ThreadPool;
}

namespace SSD::Storage {

struct AzureBlobClientOptions {
    // EN: Shared access signature appended to every request URL (with or without leading '?').
    // FR: Signature d'accès partagé ajoutée à chaque URL de requête (avec ou sans '?' initial).
    std::string sas_token;
    std::string api_version = "2021-08-06";
    Http::HttpClientOptions http;
    RetryConfig retry;
};

// EN: Azure Blob Storage REST client. Control-plane requests run on the thread pool, each
//     upload runs on its own thread. All of them go through ErrorRecoveryManager, so throttling and 5xx answers are retried.
//     Always create it through std::make_shared: pending operations keep the client alive.
// FR: Client REST Azure Blob Storage. Les requêtes de contrôle s'exécutent sur le pool de threads,
//     chaque envoi sur son propre thread. Toutes passent par ErrorRecoveryManager : limitations et réponses 5xx sont retentées.
//     Toujours créer via std::make_shared : les opérations en cours maintiennent le client en vie.
class AzureBlobStorageClient : public IBlobStorageClient,
                               public std::enable_shared_from_this<AzureBlobStorageClient> {
public:
    AzureBlobStorageClient(std::string endpoint, AzureBlobClientOptions options, ThreadPool& pool);

    std::future<ServiceProperties> getServiceProperties(const CancellationToken& token) override;
    std::future<void> setServiceProperties(const ServiceProperties& properties,
                                           const CancellationToken& token) override;
    std::future<bool> createContainerIfNotExists(const std::string& container,
                                                 const CancellationToken& token) override;
    std::future<void> uploadBlob(const std::string& container, const std::string& blob_name,
                                 const std::filesystem::path& file_path,
                                 const std::string& content_type,
                                 const CancellationToken& token) override;

    // EN: URL builders (exposed for tests). Path segments are percent-encoded, '/' is kept in blob names.
    // FR: Construction d'URL (exposée pour les tests). Les segments sont encodés, '/' est gardé dans les noms de blobs.
    std::string serviceUrl(const std::string& query) const;
    std::string resourceUrl(const std::string& path, const std::string& query) const;

    static std::string encodePath(const std::string& path);

    // EN: Factory suitable for the orchestrator.
    // FR: Fabrique utilisable par l'orchestrateur.
    static StorageClientFactory factory(AzureBlobClientOptions options, ThreadPool& pool);

private:
    Http::HttpRequest makeRequest(const std::string& method, const std::string& url) const;

    std::string endpoint_;
    std::string sas_query_;
    AzureBlobClientOptions options_;
    ThreadPool& pool_;
    Http::HttpClient http_;
};

} // namespace SSD::Storage
