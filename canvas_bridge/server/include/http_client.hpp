#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace canvas::server {

struct HttpResponse {
    long status = 0;
    std::string body;
    // Lower-cased names; repeated headers keep the last value.
    std::map<std::string, std::string> headers;

    bool ok() const { return status >= 200 && status < 300; }
};

struct MultipartField {
    std::string name;
    std::string value;
    // When set the part is streamed from this file and value is ignored.
    std::filesystem::path file;
};

// Thin blocking libcurl wrapper. A fresh easy handle is used per request so
// one instance can be shared by every worker. Transport failures throw
// std::runtime_error; HTTP error statuses are returned to the caller.
class HttpClient {
public:
    explicit HttpClient(long timeout_ms = 120000);
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const std::vector<std::string>& headers) const;
    virtual HttpResponse post(const std::string& url,
                              const std::vector<std::string>& headers,
                              const std::string& body) const;
    virtual HttpResponse post_multipart(const std::string& url,
                                        const std::vector<std::string>& headers,
                                        const std::vector<MultipartField>& fields) const;

    // Target of rel="next" in an RFC 8288 Link header, or empty.
    static std::string next_link(const std::string& link_header);

private:
    long timeout_ms_;
};

}  // namespace canvas::server
