#include "../include/http_client.hpp"
#include <curl/curl.h>
#include <string.h>

static size_t appendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpClient::HttpClient(uint32_t timeout_ms) : timeout_ms_(timeout_ms) {}

HttpClient::~HttpClient() {}

HttpResponse HttpClient::post(const char* url, const char* data, size_t len,
                              const char* content_type,
                              const char* header_keys[], const char* header_values[], int header_count) {
    HttpResponse response;
    if (!url || (strncmp(url, "http://", 7) != 0 && strncmp(url, "https://", 8) != 0)) {
        response.error = std::string("not an http(s) URL: '") + (url ? url : "") + "'";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* headers = nullptr;
    std::string ct = std::string("Content-Type: ") +
                     ((content_type && strlen(content_type) > 0) ? content_type : "application/json");
    headers = curl_slist_append(headers, ct.c_str());
    for (int i = 0; i < header_count; ++i) {
        std::string h = std::string(header_keys[i]) + ": " + header_values[i];
        headers = curl_slist_append(headers, h.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)len);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
    } else {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status_code = (int)code;
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}
