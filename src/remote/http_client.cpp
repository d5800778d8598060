#include "http_client.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>

namespace {

void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using MimeHandle = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

// Per-request state shared with the libcurl callbacks. Exceptions cannot
// cross the C boundary: they are parked here and rethrown after perform.
struct Transfer {
    CURL* curl = nullptr;
    HttpResponse response;

    // Streaming download
    DownloadSink* sink = nullptr;
    int64_t skip = 0;              // bytes to drop (server ignored Range)
    int64_t requested_offset = 0;
    bool status_checked = false;
    bool to_sink = false;

    // Streaming upload
    UploadSource* source = nullptr;

    std::exception_ptr error;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    size_t total = size * nitems;
    std::string line(buffer, total);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = to_lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        trim(value);
        t->response.headers[name] = value;
    } else if (line.rfind("HTTP/", 0) == 0) {
        // New status line (redirects, 100-continue): forget earlier headers
        t->response.headers.clear();
    }
    return total;
}

size_t body_cb(char* data, size_t size, size_t nmemb, void* userp) {
    auto* t = static_cast<Transfer*>(userp);
    size_t total = size * nmemb;

    if (!t->sink) {
        t->response.body.append(data, total);
        return total;
    }

    if (!t->status_checked) {
        t->status_checked = true;
        long status = 0;
        curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &status);
        t->to_sink = (status == 200 || status == 206);
        if (status == 200 && t->requested_offset > 0) {
            t->skip = t->requested_offset;
        }
    }
    if (!t->to_sink) {
        t->response.body.append(data, total);
        return total;
    }

    try {
        size_t start = 0;
        if (t->skip > 0) {
            start = static_cast<size_t>(std::min<int64_t>(t->skip, static_cast<int64_t>(total)));
            t->skip -= static_cast<int64_t>(start);
        }
        if (start < total) t->sink->write(data + start, total - start);
        return total;
    } catch (...) {
        t->error = std::current_exception();
        return 0;   // makes libcurl abort with CURLE_WRITE_ERROR
    }
}

size_t read_cb(char* buffer, size_t size, size_t nitems, void* arg) {
    auto* t = static_cast<Transfer*>(arg);
    try {
        return t->source->read(buffer, size * nitems);
    } catch (...) {
        t->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

EasyHandle new_handle(const HttpOptions& opts, const std::string& url, Transfer& t) {
    ensure_curl_global();
    EasyHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw TransferError(ErrorKind::Unexpected, "curl_easy_init failed");
    }
    t.curl = curl.get();

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts.connect_timeout));
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, opts.ssl_verify ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, opts.ssl_verify ? 2L : 0L);
    if (!opts.ca_bundle.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, opts.ca_bundle.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &t);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, body_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &t);
    return curl;
}

HeaderList build_headers(const HttpOptions& opts, const std::vector<std::string>& extra) {
    HeaderList list(nullptr, &curl_slist_free_all);
    curl_slist* raw = nullptr;
    for (const auto& h : opts.headers) raw = curl_slist_append(raw, h.c_str());
    for (const auto& h : extra) raw = curl_slist_append(raw, h.c_str());
    list.reset(raw);
    return list;
}

void stall_timeout(CURL* curl, int secs) {
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(secs));
}

void perform(Transfer& t, const std::string& url) {
    CURLcode code = curl_easy_perform(t.curl);
    if (t.error) std::rethrow_exception(t.error);
    if (code != CURLE_OK) {
        throw TransferError(ErrorKind::ConnectionError,
                            fmt::format("{}: {}", url, curl_easy_strerror(code)));
    }
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &t.response.status);
}

} // namespace

HttpClient::HttpClient(HttpOptions options) : options_(std::move(options)) {
    ensure_curl_global();
}

std::string HttpClient::escape(const std::string& s) {
    ensure_curl_global();
    char* out = curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.size()));
    if (!out) return s;
    std::string r(out);
    curl_free(out);
    return r;
}

HttpResponse HttpClient::get(const std::string& url, int timeout) {
    Transfer t;
    auto curl = new_handle(options_, url, t);
    auto headers = build_headers(options_, {});
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout));
    perform(t, url);
    return t.response;
}

HttpResponse HttpClient::post_json(const std::string& url, const std::string& body, int timeout) {
    Transfer t;
    auto curl = new_handle(options_, url, t);
    auto headers = build_headers(options_, {"Content-Type: application/json"});
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout));
    perform(t, url);
    return t.response;
}

HttpResponse HttpClient::post_multipart(const std::string& url,
                                        const std::vector<MultipartField>& fields,
                                        const std::string& file_field,
                                        const std::string& filename,
                                        UploadSource& source, int stall_secs) {
    Transfer t;
    t.source = &source;
    auto curl = new_handle(options_, url, t);
    // No "Expect: 100-continue" round trip before a large body
    auto headers = build_headers(options_, {"Expect:"});
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    MimeHandle mime(curl_mime_init(curl.get()), &curl_mime_free);
    for (const auto& f : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, f.name.c_str());
        curl_mime_data(part, f.value.c_str(), CURL_ZERO_TERMINATED);
    }
    curl_mimepart* file = curl_mime_addpart(mime.get());
    curl_mime_name(file, file_field.c_str());
    curl_mime_filename(file, filename.c_str());
    curl_mime_type(file, "application/octet-stream");
    curl_mime_data_cb(file, static_cast<curl_off_t>(source.size()),
                      read_cb, nullptr, nullptr, &t);

    curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
    stall_timeout(curl.get(), stall_secs);
    perform(t, url);
    return t.response;
}

HttpResponse HttpClient::get_range(const std::string& url, int64_t offset, DownloadSink& sink,
                                   int stall_secs) {
    Transfer t;
    t.sink = &sink;
    t.requested_offset = offset;
    auto curl = new_handle(options_, url, t);
    auto headers = build_headers(options_, {});
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    std::string range = fmt::format("{}-", offset);
    if (offset > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }
    stall_timeout(curl.get(), stall_secs);
    perform(t, url);

    // A transfer that ended before all promised bytes arrived
    if (t.to_sink && t.skip > 0) {
        throw TransferError(ErrorKind::ConnectionError,
                            fmt::format("{}: connection closed before offset {}", url, offset));
    }
    return t.response;
}
