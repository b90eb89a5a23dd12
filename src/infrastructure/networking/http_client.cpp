// EN: Implementation of the HttpClient class over libcurl.
// FR: Implémentation de la classe HttpClient sur libcurl.

#include "infrastructure/networking/http_client.hpp"
#include "infrastructure/logging/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>

namespace SSD::Http {

namespace {

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct FileCloser {
    void operator()(std::FILE* file) const { std::fclose(file); }
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

// EN: Callback for writing response body.
// FR: Callback pour écrire le corps de la réponse.
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    const size_t total = size * nmemb;
    body->append(static_cast<char*>(contents), total);
    return total;
}

// EN: Callback for parsing response headers. Keys are lower-cased.
// FR: Callback pour parser les headers de la réponse. Les clés sont mises en minuscules.
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const std::string line(buffer, total);
    const auto pos = line.find(':');
    if (pos != std::string::npos) {
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        key.erase(key.find_last_not_of(" \r\n") + 1);
        const auto first = value.find_first_not_of(" \t");
        value = first == std::string::npos ? std::string() : value.substr(first);
        value.erase(value.find_last_not_of(" \r\n") + 1);
        (*headers)[toLower(key)] = value;
    }
    return total;
}

size_t readFileCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    return std::fread(buffer, size, nitems, static_cast<std::FILE*>(userdata));
}

// EN: Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
// FR: Une valeur non nulle interrompt le transfert avec CURLE_ABORTED_BY_CALLBACK.
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return token->isCancellationRequested() ? 1 : 0;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

HttpStatusError::HttpStatusError(long status, std::string body, std::string error_code)
    : std::runtime_error("HTTP " + std::to_string(status) +
                         (error_code.empty() ? std::string() : " " + error_code)),
      status_(status), body_(std::move(body)), error_code_(std::move(error_code)) {}

HttpClient::HttpClient(HttpClientOptions options) : options_(std::move(options)) {
    ensureCurlInitialized();
}

HttpResponse HttpClient::perform(const HttpRequest& request, const CancellationToken& token) const {
    token.throwIfCancellationRequested();

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw HttpTransportError(CURLE_FAILED_INIT, "CURL init failed");
    }

    HttpResponse response;
    CURL* handle = curl.get();

    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &token);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);

    std::unique_ptr<std::FILE, FileCloser> upload;
    const std::string body = request.body ? *request.body : std::string();
    if (request.upload_file) {
        upload.reset(std::fopen(request.upload_file->c_str(), "rb"));
        if (!upload) {
            throw std::runtime_error("Cannot open file for upload: " + *request.upload_file);
        }
        std::fseek(upload.get(), 0, SEEK_END);
        const long size = std::ftell(upload.get());
        std::fseek(upload.get(), 0, SEEK_SET);
        curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, readFileCallback);
        curl_easy_setopt(handle, CURLOPT_READDATA, upload.get());
        curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        if (request.method != "PUT") {
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
    } else if (request.method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        raw_headers = curl_slist_append(raw_headers, (key + ": " + value).c_str());
    }
    // EN: Disable "Expect: 100-continue" round trips on uploads.
    // FR: Désactive les allers-retours "Expect: 100-continue" sur les envois.
    raw_headers = curl_slist_append(raw_headers, "Expect:");
    std::unique_ptr<curl_slist, CurlListDeleter> header_list(raw_headers);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);

    const auto start = std::chrono::steady_clock::now();
    const CURLcode result = curl_easy_perform(handle);
    response.elapsed_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());

    if (result == CURLE_ABORTED_BY_CALLBACK && token.isCancellationRequested()) {
        throw OperationCancelledError("HTTP " + request.method + " cancelled");
    }
    if (result != CURLE_OK) {
        const std::string message = error_buffer[0] ? error_buffer : curl_easy_strerror(result);
        throw HttpTransportError(static_cast<int>(result), request.method + " failed: " + message);
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    SSD_LOG_DEBUG("http", request.method + " -> " + std::to_string(response.status) +
                  " in " + std::to_string(response.elapsed_ms) + "ms");
    return response;
}

void HttpClient::ensureSuccess(const HttpResponse& response) {
    if (response.status < 200 || response.status >= 300) {
        throw HttpStatusError(response.status, response.body, response.header("x-ms-error-code"));
    }
}

} // namespace SSD::Http
