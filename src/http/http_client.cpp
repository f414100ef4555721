// EN: Implementation of the HttpClient class on top of libcurl easy handles.
// FR : Implémentation de la classe HttpClient au-dessus des handles easy de libcurl.

#include "http/http_client.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include <curl/curl.h>

namespace SHC {
namespace Http {

namespace {

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

// EN: Callback for writing response body.
// FR : Callback pour écrire le corps de la réponse.
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

// EN: curl_global_init is not thread-safe; run it once for the process.
// FR : curl_global_init n'est pas thread-safe ; exécuté une seule fois pour le processus.
void ensureCurlInitialized() {
    static const CURLcode init_result = curl_global_init(CURL_GLOBAL_ALL);
    if (init_result != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(init_result));
    }
}

}  // namespace

HttpClient::HttpClient(int connectTimeoutMs, int readTimeoutMs)
    : connectTimeoutMs_(connectTimeoutMs), readTimeoutMs_(readTimeoutMs) {
    ensureCurlInitialized();
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& extraHeaders) {
    return perform(HttpRequest{"GET", url, extraHeaders, std::nullopt});
}

HttpResponse HttpClient::put(const std::string& url,
                             const std::map<std::string, std::string>& extraHeaders,
                             const std::string& body) {
    return perform(HttpRequest{"PUT", url, extraHeaders, body});
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::map<std::string, std::string>& extraHeaders,
                              const std::string& body) {
    return perform(HttpRequest{"POST", url, extraHeaders, body});
}

HttpResponse HttpClient::perform(const HttpRequest& request) {
    CurlHandle curl(curl_easy_init());
    if (!curl) throw std::runtime_error("CURL init failed");

    HttpResponse resp;
    std::string responseBody;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeoutMs_));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(readTimeoutMs_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &responseBody);

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (request.body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body->size()));
    }

    HeaderList chunk;
    for (const auto& [k, v] : request.headers) {
        std::string line = k + ": " + v;
        curl_slist* appended = curl_slist_append(chunk.get(), line.c_str());
        if (!appended) throw std::runtime_error("curl_slist_append failed");
        chunk.release();
        chunk.reset(appended);
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, chunk.get());

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl.get());
    auto end = std::chrono::steady_clock::now();

    resp.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    if (res != CURLE_OK) {
        std::string errMsg = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        throw std::runtime_error(request.method + " " + request.url + ": " + errMsg);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(responseBody);
    return resp;
}

std::string HttpClient::urlEncode(const std::string& value) {
    ensureCurlInitialized();
    CurlHandle curl(curl_easy_init());
    if (!curl) throw std::runtime_error("CURL init failed");

    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) throw std::runtime_error("curl_easy_escape failed");
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

}  // namespace Http
}  // namespace SHC
