// EN: Declaration of the HttpClient class and related types. One perform() entry point over libcurl,
//     cancellation-aware, with typed errors for transport failures and unexpected status codes.
// FR: Déclaration de la classe HttpClient et des types associés. Un seul point d'entrée perform()
//     sur libcurl, sensible à l'annulation, avec erreurs typées pour le transport et les statuts inattendus.

#pragma once

#include "infrastructure/threading/cancellation.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace SSD::Http {

// EN: Structure representing an HTTP request. When upload_file is set its content is streamed as the body.
// FR: Structure représentant une requête HTTP. Si upload_file est défini, son contenu est envoyé comme corps.
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
    std::optional<std::string> upload_file;
};

// EN: Structure representing an HTTP response. Header names are lower-cased.
// FR: Structure représentant une réponse HTTP. Les noms de headers sont en minuscules.
struct HttpResponse {
    long status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    long elapsed_ms = 0;

    std::string header(const std::string& name) const;
};

struct HttpClientOptions {
    long connect_timeout_ms = 10000;
    long timeout_ms = 120000;
    std::string user_agent = "ssdctl/1.0";
};

// EN: Raised when the server answers with a status the caller did not expect.
// FR: Levée quand le serveur répond avec un statut inattendu par l'appelant.
class HttpStatusError : public std::runtime_error {
public:
    HttpStatusError(long status, std::string body, std::string error_code = {});

    long status() const { return status_; }
    const std::string& body() const { return body_; }

    // EN: Service-specific error code (x-ms-error-code for Azure Storage), empty if absent.
    // FR: Code d'erreur spécifique au service (x-ms-error-code pour Azure Storage), vide si absent.
    const std::string& errorCode() const { return error_code_; }

private:
    long status_;
    std::string body_;
    std::string error_code_;
};

// EN: Raised when no HTTP response was obtained (DNS, connect, TLS, timeout...).
// FR: Levée quand aucune réponse HTTP n'a été obtenue (DNS, connexion, TLS, timeout...).
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(int curl_code, const std::string& message)
        : std::runtime_error(message), curl_code_(curl_code) {}

    int curlCode() const { return curl_code_; }

private:
    int curl_code_;
};

// EN: HttpClient class. Thread-safe: each perform() call uses its own curl handle.
// FR: Classe HttpClient. Thread-safe : chaque appel à perform() utilise son propre handle curl.
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options = {});

    // EN: Execute the request. Throws HttpTransportError, or OperationCancelledError when the token fires.
    //     Non-2xx statuses are returned, not thrown; see ensureSuccess().
    // FR: Exécute la requête. Lève HttpTransportError, ou OperationCancelledError si le token est déclenché.
    //     Les statuts non-2xx sont retournés, pas levés ; voir ensureSuccess().
    HttpResponse perform(const HttpRequest& request, const CancellationToken& token = {}) const;

    // EN: Throws HttpStatusError unless the status is 2xx.
    // FR: Lève HttpStatusError si le statut n'est pas 2xx.
    static void ensureSuccess(const HttpResponse& response);

    const HttpClientOptions& options() const { return options_; }

private:
    HttpClientOptions options_;
};

} // namespace SSD::Http
