// EN: Implementation of the Azure Blob Storage REST client.
// FR: Implémentation du client REST Azure Blob Storage.

#include "storage/azure_blob_client.hpp"
#include "storage/service_properties_codec.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <cctype>
#include <ctime>
#include <cstdio>
#include <future>

namespace SSD::Storage {

namespace {

// EN: RFC 1123 date for x-ms-date.
// FR: Date RFC 1123 pour x-ms-date.
std::string httpDate() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &utc);
    return buffer;
}

} // namespace

AzureBlobStorageClient::AzureBlobStorageClient(std::string endpoint, AzureBlobClientOptions options,
                                               ThreadPool& pool)
    : endpoint_(std::move(endpoint)), options_(std::move(options)), pool_(pool), http_(options_.http) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    if (endpoint_.empty()) {
        throw std::invalid_argument("Blob endpoint must not be empty");
    }
    sas_query_ = options_.sas_token;
    if (!sas_query_.empty() && sas_query_.front() == '?') {
        sas_query_.erase(0, 1);
    }
    if (sas_query_.empty()) {
        SSD_LOG_WARN("storage", "No SAS token configured; requests to " + endpoint_ + " are anonymous");
    }
}

std::string AzureBlobStorageClient::encodePath(const std::string& path) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string AzureBlobStorageClient::serviceUrl(const std::string& query) const {
    return resourceUrl("", query);
}

std::string AzureBlobStorageClient::resourceUrl(const std::string& path, const std::string& query) const {
    std::string url = endpoint_ + "/" + encodePath(path);
    std::string full_query = query;
    if (!sas_query_.empty()) {
        full_query += (full_query.empty() ? "" : "&") + sas_query_;
    }
    if (!full_query.empty()) {
        url += "?" + full_query;
    }
    return url;
}

Http::HttpRequest AzureBlobStorageClient::makeRequest(const std::string& method, const std::string& url) const {
    Http::HttpRequest request;
    request.method = method;
    request.url = url;
    request.headers["x-ms-version"] = options_.api_version;
    request.headers["x-ms-date"] = httpDate();
    return request;
}

std::future<ServiceProperties> AzureBlobStorageClient::getServiceProperties(const CancellationToken& token) {
    auto self = shared_from_this();
    return pool_.submitNamed("storage: get service properties", TaskPriority::HIGH, [self, token]() {
        return ErrorRecoveryManager::getInstance().executeWithRetry(
            "get service properties", self->options_.retry, token, [&]() {
                const auto response = self->http_.perform(
                    self->makeRequest("GET", self->serviceUrl("restype=service&comp=properties")), token);
                Http::HttpClient::ensureSuccess(response);
                return ServicePropertiesCodec::parse(response.body);
            });
    });
}

std::future<void> AzureBlobStorageClient::setServiceProperties(const ServiceProperties& properties,
                                                               const CancellationToken& token) {
    auto self = shared_from_this();
    return pool_.submitNamed("storage: set service properties", TaskPriority::HIGH, [self, properties, token]() {
        const std::string body = ServicePropertiesCodec::serialize(properties);
        ErrorRecoveryManager::getInstance().executeWithRetry(
            "set service properties", self->options_.retry, token, [&]() {
                auto request = self->makeRequest("PUT", self->serviceUrl("restype=service&comp=properties"));
                request.headers["Content-Type"] = "application/xml";
                request.body = body;
                Http::HttpClient::ensureSuccess(self->http_.perform(request, token));
            });
    });
}

// EN: 201 means created; 409 ContainerAlreadyExists means it was already there.
// FR: 201 signifie créé ; 409 ContainerAlreadyExists signifie qu'il existait déjà.
std::future<bool> AzureBlobStorageClient::createContainerIfNotExists(const std::string& container,
                                                                     const CancellationToken& token) {
    auto self = shared_from_this();
    return pool_.submitNamed("storage: create container " + container, TaskPriority::HIGH,
                             [self, container, token]() {
        return ErrorRecoveryManager::getInstance().executeWithRetry(
            "create container " + container, self->options_.retry, token, [&]() {
                auto request = self->makeRequest("PUT", self->resourceUrl(container, "restype=container"));
                request.body = std::string();
                const auto response = self->http_.perform(request, token);
                if (response.status == 409 &&
                    response.header("x-ms-error-code") == "ContainerAlreadyExists") {
                    return false;
                }
                Http::HttpClient::ensureSuccess(response);
                return true;
            });
    });
}

std::future<void> AzureBlobStorageClient::uploadBlob(const std::string& container, const std::string& blob_name,
                                                     const std::filesystem::path& file_path,
                                                     const std::string& content_type,
                                                     const CancellationToken& token) {
    // EN: One thread per upload so the fan-out is not bounded by the pool's worker count.
    // FR: Un thread par envoi pour que la diffusion ne soit pas bornée par le nombre de workers du pool.
    auto self = shared_from_this();
    return std::async(std::launch::async, [self, container, blob_name, file_path, content_type, token]() {
        ErrorRecoveryManager::getInstance().executeWithRetry(
            "upload " + blob_name, self->options_.retry, token, [&]() {
                auto request = self->makeRequest("PUT", self->resourceUrl(container + "/" + blob_name, ""));
                request.headers["x-ms-blob-type"] = "BlockBlob";
                request.headers["Content-Type"] = content_type;
                request.headers["x-ms-blob-content-type"] = content_type;
                request.upload_file = file_path.string();
                Http::HttpClient::ensureSuccess(self->http_.perform(request, token));
            });
        SSD_LOG_DEBUG_META("storage", "Uploaded blob " + blob_name,
                           (std::unordered_map<std::string, std::string>{
                               {"container", container}, {"content_type", content_type}}));
    });
}

StorageClientFactory AzureBlobStorageClient::factory(AzureBlobClientOptions options, ThreadPool& pool) {
    return [options, &pool](const std::string& endpoint) -> std::shared_ptr<IBlobStorageClient> {
        return std::make_shared<AzureBlobStorageClient>(endpoint, options, pool);
    };
}

} // namespace SSD::Storage
