// EN: Unit tests for AzureBlobStorageClient against a loopback HTTP server.
// FR: Tests unitaires de AzureBlobStorageClient contre un serveur HTTP local.

#include <gtest/gtest.h>
#include "storage/azure_blob_client.hpp"
#include "storage/service_properties_codec.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"
#include "support/loopback_http_server.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <thread>
#include <vector>

using namespace SSD;
using namespace SSD::Storage;
using SSD::Testing::LoopbackHttpServer;
using SSD::Testing::RecordedRequest;
using SSD::Testing::ScriptedResponse;
using namespace std::chrono_literals;

namespace {

const std::string kCurrentProperties =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?><StorageServiceProperties>"
    "<Cors><CorsRule><AllowedOrigins>*</AllowedOrigins></CorsRule></Cors>"
    "<StaticWebsite><Enabled>false</Enabled></StaticWebsite>"
    "<DefaultServiceVersion>2021-08-06</DefaultServiceVersion>"
    "</StorageServiceProperties>";

} // namespace

// EN: Test fixture with a pool, fast retries and silenced logs
// FR: Fixture de test avec un pool, des retries rapides et des logs silencieux
class AzureBlobClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleStream(&log_sink_);
        // EN: Keep loopback requests away from any proxy configured in the environment.
        // FR: Garde les requêtes locales à l'écart de tout proxy configuré dans l'environnement.
        setenv("no_proxy", "127.0.0.1,localhost", 1);
        ThreadPoolConfig config;
        config.threads = 4;
        pool_ = std::make_unique<ThreadPool>(config);

        options_.sas_token = "?sv=2021-08-06&sig=abc%3D";
        options_.retry.max_attempts = 3;
        options_.retry.initial_delay = 5ms;
        options_.retry.enable_jitter = false;
    }

    void TearDown() override {
        pool_.reset();
        Logger::getInstance().setConsoleStream(nullptr);
    }

    std::shared_ptr<AzureBlobStorageClient> makeClient(const std::string& endpoint) {
        return std::make_shared<AzureBlobStorageClient>(endpoint, options_, *pool_);
    }

    std::ostringstream log_sink_;
    std::unique_ptr<ThreadPool> pool_;
    AzureBlobClientOptions options_;
};

TEST_F(AzureBlobClientTest, EncodePathKeepsSlashesAndEscapesTheRest) {
    EXPECT_EQ(AzureBlobStorageClient::encodePath("$web"), "%24web");
    EXPECT_EQ(AzureBlobStorageClient::encodePath("assets/app.min.js"), "assets/app.min.js");
    EXPECT_EQ(AzureBlobStorageClient::encodePath("my file+1.html"), "my%20file%2B1.html");
    EXPECT_EQ(AzureBlobStorageClient::encodePath("caf\xC3\xA9"), "caf%C3%A9");
}

TEST_F(AzureBlobClientTest, UrlsCarryTheSasToken) {
    auto client = makeClient("https://account.blob.core.windows.net/");

    EXPECT_EQ(client->serviceUrl("restype=service&comp=properties"),
              "https://account.blob.core.windows.net/?restype=service&comp=properties&sv=2021-08-06&sig=abc%3D");
    EXPECT_EQ(client->resourceUrl("$web/index.html", ""),
              "https://account.blob.core.windows.net/%24web/index.html?sv=2021-08-06&sig=abc%3D");
}

TEST_F(AzureBlobClientTest, UrlsWithoutSasToken) {
    options_.sas_token.clear();
    auto client = makeClient("https://account.blob.core.windows.net");

    EXPECT_EQ(client->resourceUrl("$web", "restype=container"),
              "https://account.blob.core.windows.net/%24web?restype=container");
    EXPECT_EQ(client->resourceUrl("$web/a.css", ""), "https://account.blob.core.windows.net/%24web/a.css");
}

TEST_F(AzureBlobClientTest, EmptyEndpointIsRejected) {
    EXPECT_THROW(makeClient(""), std::invalid_argument);
    EXPECT_THROW(makeClient("///"), std::invalid_argument);
}

// EN: Read-modify-write through the REST API keeps the other service elements
// FR: La lecture-modification-écriture via l'API REST conserve les autres éléments du service
TEST_F(AzureBlobClientTest, GetAndSetServiceProperties) {
    LoopbackHttpServer server([](const RecordedRequest& request) {
        ScriptedResponse response;
        if (request.method == "GET") {
            response.body = kCurrentProperties;
        } else {
            response.status = 202;
        }
        return response;
    });
    auto client = makeClient(server.baseUrl());

    auto pending_read = client->getServiceProperties({});
    ServiceProperties properties = pending_read.get();
    EXPECT_FALSE(properties.static_website.enabled);

    properties.static_website.enabled = true;
    properties.static_website.index_document = "index.html";
    properties.static_website.error_document_404_path = "index.html";
    client->setServiceProperties(properties, {}).get();

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].method, "GET");
    EXPECT_EQ(requests[0].target, "/?restype=service&comp=properties&sv=2021-08-06&sig=abc%3D");
    EXPECT_EQ(requests[0].header("x-ms-version"), "2021-08-06");
    EXPECT_FALSE(requests[0].header("x-ms-date").empty());

    EXPECT_EQ(requests[1].method, "PUT");
    EXPECT_EQ(requests[1].target, requests[0].target);
    EXPECT_EQ(requests[1].header("content-type"), "application/xml");
    EXPECT_NE(requests[1].body.find("<Cors><CorsRule><AllowedOrigins>*</AllowedOrigins></CorsRule></Cors>"),
              std::string::npos);
    EXPECT_NE(requests[1].body.find("<DefaultServiceVersion>2021-08-06</DefaultServiceVersion>"), std::string::npos);
    EXPECT_NE(requests[1].body.find("<StaticWebsite><Enabled>true</Enabled><IndexDocument>index.html</IndexDocument>"
                                    "<ErrorDocument404Path>index.html</ErrorDocument404Path></StaticWebsite>"),
              std::string::npos);
}

TEST_F(AzureBlobClientTest, CreateContainerReportsCreatedOrExisting) {
    std::atomic<int> calls{0};
    LoopbackHttpServer server([&calls](const RecordedRequest&) {
        ScriptedResponse response;
        if (calls++ == 0) {
            response.status = 201;
        } else {
            response.status = 409;
            response.headers["x-ms-error-code"] = "ContainerAlreadyExists";
        }
        return response;
    });
    auto client = makeClient(server.baseUrl());

    EXPECT_TRUE(client->createContainerIfNotExists("$web", {}).get());
    EXPECT_FALSE(client->createContainerIfNotExists("$web", {}).get());

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].method, "PUT");
    EXPECT_EQ(requests[0].target, "/%24web?restype=container&sv=2021-08-06&sig=abc%3D");
    EXPECT_EQ(requests[0].header("content-length"), "0");
}

TEST_F(AzureBlobClientTest, CreateContainerFailsOnOtherConflicts) {
    LoopbackHttpServer server([](const RecordedRequest&) {
        ScriptedResponse response;
        response.status = 409;
        response.headers["x-ms-error-code"] = "ContainerBeingDeleted";
        return response;
    });
    auto client = makeClient(server.baseUrl());

    auto pending = client->createContainerIfNotExists("$web", {});
    EXPECT_THROW(pending.get(), Http::HttpStatusError);
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST_F(AzureBlobClientTest, UploadBlobSendsFileWithContentType) {
    const auto file = std::filesystem::temp_directory_path() / "ssd_azure_upload.css";
    {
        std::ofstream out(file, std::ios::binary);
        out << "body { color: red; }";
    }

    LoopbackHttpServer server([](const RecordedRequest&) {
        ScriptedResponse response;
        response.status = 201;
        return response;
    });
    auto client = makeClient(server.baseUrl());

    client->uploadBlob("$web", "assets/site style.css", file, "text/css", {}).get();

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "PUT");
    EXPECT_EQ(requests[0].target, "/%24web/assets/site%20style.css?sv=2021-08-06&sig=abc%3D");
    EXPECT_EQ(requests[0].header("x-ms-blob-type"), "BlockBlob");
    EXPECT_EQ(requests[0].header("content-type"), "text/css");
    EXPECT_EQ(requests[0].header("x-ms-blob-content-type"), "text/css");
    EXPECT_EQ(requests[0].body, "body { color: red; }");

    std::filesystem::remove(file);
}

// EN: Uploads do not queue behind the pool workers
// FR: Les envois ne font pas la queue derrière les workers du pool
TEST_F(AzureBlobClientTest, UploadsAreNotBoundedByPoolWorkers) {
    const auto file = std::filesystem::temp_directory_path() / "ssd_azure_fanout.html";
    {
        std::ofstream out(file, std::ios::binary);
        out << "<p>fan-out</p>";
    }

    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
    LoopbackHttpServer server([&in_flight, &peak](const RecordedRequest&) {
        const int now = ++in_flight;
        int previous = peak.load();
        while (now > previous && !peak.compare_exchange_weak(previous, now)) {
        }
        std::this_thread::sleep_for(300ms);
        --in_flight;
        ScriptedResponse response;
        response.status = 201;
        return response;
    });
    auto client = makeClient(server.baseUrl());

    constexpr int kUploads = 12;
    const auto started = std::chrono::steady_clock::now();
    std::vector<std::future<void>> pending;
    for (int i = 0; i < kUploads; ++i) {
        pending.push_back(client->uploadBlob("$web", "page" + std::to_string(i) + ".html", file, "text/html", {}));
    }
    for (auto& upload : pending) {
        upload.get();
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;

    // EN: Four workers would need three rounds of 300ms.
    // FR: Quatre workers demanderaient trois tours de 300ms.
    EXPECT_GT(peak.load(), 4);
    EXPECT_LT(elapsed, 800ms);
    EXPECT_EQ(server.requests().size(), static_cast<size_t>(kUploads));

    std::filesystem::remove(file);
}

// EN: Throttling and server errors are retried, client errors are not
// FR: Les limitations et erreurs serveur sont retentées, pas les erreurs client
TEST_F(AzureBlobClientTest, RetriesTransientStatuses) {
    std::atomic<int> calls{0};
    LoopbackHttpServer server([&calls](const RecordedRequest&) {
        ScriptedResponse response;
        const int call = calls++;
        if (call == 0) {
            response.status = 503;
        } else if (call == 1) {
            response.status = 429;
        } else {
            response.body = kCurrentProperties;
        }
        return response;
    });
    auto client = makeClient(server.baseUrl());

    const ServiceProperties properties = client->getServiceProperties({}).get();
    EXPECT_EQ(properties.preserved_elements.size(), 2u);
    EXPECT_EQ(server.requests().size(), 3u);
}

TEST_F(AzureBlobClientTest, DoesNotRetryAuthorizationFailures) {
    LoopbackHttpServer server([](const RecordedRequest&) {
        ScriptedResponse response;
        response.status = 403;
        response.headers["x-ms-error-code"] = "AuthenticationFailed";
        return response;
    });
    auto client = makeClient(server.baseUrl());

    auto pending = client->getServiceProperties({});
    try {
        pending.get();
        FAIL() << "Expected HttpStatusError";
    } catch (const Http::HttpStatusError& e) {
        EXPECT_EQ(e.status(), 403);
        EXPECT_EQ(e.errorCode(), "AuthenticationFailed");
    }
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST_F(AzureBlobClientTest, FactoryBindsEndpoint) {
    StorageClientFactory factory = AzureBlobStorageClient::factory(options_, *pool_);
    auto client = factory("https://account.blob.core.windows.net");
    ASSERT_NE(client, nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<AzureBlobStorageClient>(client), nullptr);
}
