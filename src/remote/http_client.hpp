#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include "remote_client.hpp"

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // lowercase names

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
};

struct HttpOptions {
    int connect_timeout = 15;
    bool ssl_verify = true;
    std::string ca_bundle;
    std::vector<std::string> headers;   // "Name: value", sent with every request
};

struct MultipartField {
    std::string name;
    std::string value;
};

// Thin libcurl wrapper: one easy handle per request. Transport failures
// throw TransferError(ConnectionError); HTTP status codes are returned
// for the caller to classify.
class HttpClient {
public:
    explicit HttpClient(HttpOptions options);

    HttpResponse get(const std::string& url, int timeout);
    HttpResponse post_json(const std::string& url, const std::string& body, int timeout);

    // multipart/form-data POST; the file part is streamed from `source`.
    HttpResponse post_multipart(const std::string& url,
                                const std::vector<MultipartField>& fields,
                                const std::string& file_field,
                                const std::string& filename,
                                UploadSource& source, int stall_timeout);

    // GET with "Range: bytes=<offset>-". Successful bodies go to `sink`;
    // if the server ignores the range (200), the first `offset` bytes are
    // dropped here, so the sink always starts at `offset`. Error bodies
    // are returned in the response instead.
    HttpResponse get_range(const std::string& url, int64_t offset, DownloadSink& sink,
                           int stall_timeout);

    static std::string escape(const std::string& s);

private:
    HttpOptions options_;
};
