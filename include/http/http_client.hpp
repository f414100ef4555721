// EN: Declaration of the HttpClient class and related types. Blocking libcurl requests
// (GET, PUT, POST) with connect/read timeouts. FR : Déclaration de la classe HttpClient et des
// types associés. Requêtes libcurl bloquantes (GET, PUT, POST) avec timeouts de connexion/lecture.

#pragma once

#include <map>
#include <optional>
#include <string>

namespace SHC {
namespace Http {

// EN: Structure representing an HTTP request.
// FR : Structure représentant une requête HTTP.
struct HttpRequest {
    std::string method;
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
};

// EN: Structure representing an HTTP response.
// FR : Structure représentant une réponse HTTP.
struct HttpResponse {
    long status = 0;
    std::string body;
    long elapsed_ms = 0;

    bool ok() const { return status >= 200 && status < 300; }
};

// EN: HttpClient class. Transport failures (DNS, TLS, timeout) throw std::runtime_error;
// HTTP error statuses are returned to the caller. FR : Classe HttpClient. Les échecs de transport
// (DNS, TLS, timeout) lancent std::runtime_error ; les statuts d'erreur HTTP sont retournés.
class HttpClient {
  public:
    HttpClient(int connectTimeoutMs, int readTimeoutMs);

    HttpResponse get(const std::string& url,
                     const std::map<std::string, std::string>& extraHeaders = {});
    HttpResponse put(const std::string& url,
                     const std::map<std::string, std::string>& extraHeaders = {},
                     const std::string& body = "");
    HttpResponse post(const std::string& url,
                      const std::map<std::string, std::string>& extraHeaders = {},
                      const std::string& body = "");

    // EN: Percent-encode a URL component (path segment or query value).
    // FR : Encode en pourcentage un composant d'URL (segment de chemin ou valeur de requête).
    static std::string urlEncode(const std::string& value);

  private:
    HttpResponse perform(const HttpRequest& request);

    int connectTimeoutMs_;
    int readTimeoutMs_;
};

}  // namespace Http
}  // namespace SHC
