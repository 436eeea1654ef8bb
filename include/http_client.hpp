#pragma once
#include <stdint.h>
#include <string>

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::string error;  // transport-level failure, empty on success
    bool isSuccess() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

class HttpClient {
public:
    explicit HttpClient(uint32_t timeout_ms = 5000);
    ~HttpClient();

    // POST to an absolute http(s) URL.
    HttpResponse post(const char* url, const char* data, size_t len,
                      const char* content_type = nullptr,
                      const char* header_keys[] = nullptr, const char* header_values[] = nullptr, int header_count = 0);

private:
    uint32_t timeout_ms_;
};
