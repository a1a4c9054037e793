#include "http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace canvas::server {

namespace {

constexpr const char* kUserAgent = "canvas-bridge/1.0";

struct CurlHandle {
    CURL* h = nullptr;
    CurlHandle() { h = curl_easy_init(); }
    ~CurlHandle() {
        if (h) {
            curl_easy_cleanup(h);
        }
    }
};

struct CurlHeaders {
    curl_slist* list = nullptr;
    ~CurlHeaders() {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

struct CurlMime {
    curl_mime* mime = nullptr;
    ~CurlMime() {
        if (mime) {
            curl_mime_free(mime);
        }
    }
};

size_t write_to_string(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

size_t collect_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const std::string line(buffer, total);
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        // Status line of a redirect hop: start over.
        if (line.rfind("HTTP/", 0) == 0) {
            headers->clear();
        }
        return total;
    }
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
    std::string value = line.substr(colon + 1);
    const auto first = value.find_first_not_of(" \t");
    const auto last = value.find_last_not_of(" \t\r\n");
    value = first == std::string::npos ? std::string{} : value.substr(first, last - first + 1);
    (*headers)[name] = value;
    return total;
}

void apply_common(CURL* curl, const std::string& url, long timeout_ms, HttpResponse& response, curl_slist* headers) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 8L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 8000L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collect_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
}

curl_slist* build_headers(CurlHeaders& holder, const std::vector<std::string>& headers) {
    for (const auto& header : headers) {
        holder.list = curl_slist_append(holder.list, header.c_str());
    }
    return holder.list;
}

void perform(CURL* curl, const std::string& url, HttpResponse& response) {
    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        throw std::runtime_error("HTTP request to " + url + " failed: " + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
}

}  // namespace

HttpClient::HttpClient(long timeout_ms) : timeout_ms_(timeout_ms) {}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) const {
    CurlHandle ch;
    if (!ch.h) {
        throw std::runtime_error("curl init failed");
    }
    CurlHeaders hdr;
    HttpResponse response;
    apply_common(ch.h, url, timeout_ms_, response, build_headers(hdr, headers));
    perform(ch.h, url, response);
    return response;
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::vector<std::string>& headers,
                              const std::string& body) const {
    CurlHandle ch;
    if (!ch.h) {
        throw std::runtime_error("curl init failed");
    }
    CurlHeaders hdr;
    HttpResponse response;
    apply_common(ch.h, url, timeout_ms_, response, build_headers(hdr, headers));
    curl_easy_setopt(ch.h, CURLOPT_POST, 1L);
    curl_easy_setopt(ch.h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(ch.h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    perform(ch.h, url, response);
    return response;
}

HttpResponse HttpClient::post_multipart(const std::string& url,
                                        const std::vector<std::string>& headers,
                                        const std::vector<MultipartField>& fields) const {
    CurlHandle ch;
    if (!ch.h) {
        throw std::runtime_error("curl init failed");
    }
    CurlHeaders hdr;
    CurlMime form;
    form.mime = curl_mime_init(ch.h);
    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(form.mime);
        curl_mime_name(part, field.name.c_str());
        if (!field.file.empty()) {
            if (curl_mime_filedata(part, field.file.c_str()) != CURLE_OK) {
                throw std::runtime_error("Cannot attach " + field.file.string());
            }
        } else {
            curl_mime_data(part, field.value.c_str(), CURL_ZERO_TERMINATED);
        }
    }
    HttpResponse response;
    apply_common(ch.h, url, timeout_ms_, response, build_headers(hdr, headers));
    curl_easy_setopt(ch.h, CURLOPT_MIMEPOST, form.mime);
    perform(ch.h, url, response);
    return response;
}

std::string HttpClient::next_link(const std::string& link_header) {
    std::size_t start = 0;
    while (start < link_header.size()) {
        auto end = link_header.find(',', start);
        if (end == std::string::npos) {
            end = link_header.size();
        }
        const std::string part = link_header.substr(start, end - start);
        start = end + 1;
        if (part.find("rel=\"next\"") == std::string::npos) {
            continue;
        }
        const auto open = part.find('<');
        const auto close = part.find('>', open);
        if (open != std::string::npos && close != std::string::npos) {
            return part.substr(open + 1, close - open - 1);
        }
    }
    return {};
}

}  // namespace canvas::server
