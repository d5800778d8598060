#include "ckan_client.hpp"
#include <managers/job_log.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

using json = nlohmann::json;

CkanClient::CkanClient(const ServerConfig& server, const TransferConfig& transfer)
    : server_(server.url),
      api_url_(api_url(server.url)),
      api_timeout_(transfer.api_timeout),
      http_([&] {
          HttpOptions o;
          o.connect_timeout = transfer.connect_timeout;
          o.ssl_verify = server.ssl_verify;
          o.ca_bundle = server.ca_bundle;
          if (!server.api_key.empty()) {
              o.headers.push_back(fmt::format("{}: {}", CKAN_API_KEY_HEADER, server.api_key));
          }
          return o;
      }()) {
    while (!server_.empty() && server_.back() == '/') server_.pop_back();
    if (server_.find("://") == std::string::npos) server_ = "https://" + server_;
}

std::string CkanClient::api_url(const std::string& server) {
    std::string s = server;
    while (!s.empty() && s.back() == '/') s.pop_back();
    if (s.find("://") == std::string::npos) s = "https://" + s;
    return s + CKAN_API_PATH;
}

ErrorKind CkanClient::classify_http_status(long status) {
    if (status >= 200 && status < 300) return ErrorKind::None;
    switch (status) {
        case 401:
        case 403: return ErrorKind::AuthorizationError;
        case 404:
        case 410: return ErrorKind::RemoteStateVanished;
        case 400:
        case 409:
        case 413:
        case 422: return ErrorKind::InvalidTask;
        case 408:
        case 429: return ErrorKind::ConnectionError;
        default: break;
    }
    // 5xx (gateway timeouts, overloaded server) and anything unexpected
    return ErrorKind::ConnectionError;
}

json CkanClient::unwrap(long status, const std::string& body, const std::string& action) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::exception&) {
        data = json();
    }

    ErrorKind kind = classify_http_status(status);
    bool ok_body = data.is_object() && data.value("success", false) && data.contains("result");
    if (kind == ErrorKind::None && ok_body) {
        return data["result"];
    }

    // "<__type>: key: value ... (for 'action')"
    std::string e_type = fmt::format("HTTP {}", status);
    std::string etext;
    if (data.is_object() && data.contains("error") && data["error"].is_object()) {
        const json& err = data["error"];
        e_type = err.value("__type", e_type);
        for (auto it = err.begin(); it != err.end(); ++it) {
            if (it.key().rfind("_", 0) == 0) continue;
            etext += fmt::format("{}: {} ", it.key(),
                                 it.value().is_string() ? it.value().get<std::string>()
                                                        : it.value().dump());
        }
    } else if (body.size() < 200) {
        etext = body;
    }
    trim(etext);

    if (kind == ErrorKind::None) {
        // 2xx without a usable CKAN envelope: proxy error page or truncated body
        kind = ErrorKind::ConnectionError;
    }
    throw TransferError(kind, fmt::format("{}: {} (for '{}')", e_type, etext, action));
}

json CkanClient::get(const std::string& action,
                     const std::map<std::string, std::string>& params, int timeout) {
    std::string url = api_url_ + action;
    char sep = '?';
    for (const auto& kv : params) {
        url += sep;
        url += kv.first + "=" + HttpClient::escape(kv.second);
        sep = '&';
    }
    auto resp = http_.get(url, timeout);
    return unwrap(resp.status, resp.body, action);
}

json CkanClient::post(const std::string& action, const json& body, int timeout) {
    auto resp = http_.post_json(api_url_ + action, body.dump(), timeout);
    return unwrap(resp.status, resp.body, action);
}

json CkanClient::package_show(const std::string& dataset_id, int timeout) {
    return get("package_show", {{"id", dataset_id}}, timeout);
}

RemoteResource CkanClient::parse_resource(const json& res) {
    RemoteResource r;
    r.id = res.value("id", "");
    r.name = res.value("name", "");
    r.dataset_id = res.value("package_id", "");
    if (res.contains("size") && res["size"].is_number()) {
        r.size = res["size"].get<int64_t>();
    }
    if (res.contains("sha256") && res["sha256"].is_string()) {
        r.sha256 = res["sha256"].get<std::string>();
    }
    for (const char* key : {"etag", "s3_etag"}) {
        if (res.contains(key) && res[key].is_string() && r.etag.empty()) {
            r.etag = res[key].get<std::string>();
        }
    }
    if (res.contains("mimetype") && res["mimetype"].is_string()) {
        r.mimetype = res["mimetype"].get<std::string>();
    }
    for (auto it = res.begin(); it != res.end(); ++it) {
        if (it.key().rfind("sp:", 0) == 0 && !it.value().is_null()) {
            r.supplements[it.key()] = it.value().dump();
        }
    }
    return r;
}

bool CkanClient::dataset_exists(const std::string& dataset_id, int timeout) {
    try {
        json pkg = package_show(dataset_id, timeout);
        return pkg.value("state", "active") != "deleted";
    } catch (const TransferError& e) {
        if (e.kind() == ErrorKind::RemoteStateVanished) return false;
        throw;
    }
}

std::string CkanClient::create_draft_dataset(const std::string& dataset_json, int timeout) {
    json dataset;
    try {
        dataset = json::parse(dataset_json);
    } catch (const json::exception& e) {
        throw TransferError(ErrorKind::InvalidTask,
                            std::string("dataset dictionary is not valid JSON: ") + e.what());
    }
    if (!dataset.is_object()) {
        throw TransferError(ErrorKind::InvalidTask, "dataset dictionary must be a JSON object");
    }
    dataset["state"] = "draft";
    json result = post("package_create", dataset, timeout);
    std::string id = result.value("id", "");
    if (id.empty()) {
        throw TransferError(ErrorKind::ConnectionError, "package_create returned no id");
    }
    xfer_log(fmt::format("ckan: created draft dataset {}", id));
    return id;
}

std::optional<RemoteResource> CkanClient::find_resource(const std::string& dataset_id,
                                                        const std::string& resource_name,
                                                        int timeout) {
    json pkg = package_show(dataset_id, timeout);
    for (const auto& res : pkg.value("resources", json::array())) {
        if (res.value("name", "") == resource_name) {
            RemoteResource r = parse_resource(res);
            r.dataset_name = pkg.value("name", "");
            return r;
        }
    }
    return std::nullopt;
}

RemoteResource CkanClient::create_or_patch_resource(const std::string& dataset_id,
                                                    const ResourceMetadata& metadata,
                                                    UploadSource& source, int timeout) {
    std::string action = metadata.replace_id.empty() ? "resource_create" : "resource_patch";
    std::vector<MultipartField> fields;
    if (metadata.replace_id.empty()) {
        fields.push_back({"package_id", dataset_id});
    } else {
        fields.push_back({"id", metadata.replace_id});
    }
    fields.push_back({"name", metadata.name});

    auto resp = http_.post_multipart(api_url_ + action, fields, "upload",
                                     metadata.name, source, timeout);
    RemoteResource r = parse_resource(unwrap(resp.status, resp.body, action));
    if (r.etag.empty()) r.etag = resp.header("etag");
    return r;
}

void CkanClient::update_resource_supplements(const std::string& dataset_id,
                                             const std::string& resource_id,
                                             const std::map<std::string, std::string>& supplements,
                                             int timeout) {
    if (supplements.empty()) return;
    json supp = json::object();
    for (const auto& kv : supplements) {
        try {
            supp[kv.first] = json::parse(kv.second);
        } catch (const json::exception&) {
            supp[kv.first] = kv.second;   // plain string value
        }
    }
    json revise = {
        {"match", {{"id", dataset_id}}},
        {"update__resources__" + resource_id, supp},
    };
    post("package_revise", revise, timeout);
}

void CkanClient::activate_dataset(const std::string& dataset_id, int timeout) {
    json revise = {
        {"match", {{"id", dataset_id}}},
        {"update", {{"state", "active"}}},
    };
    post("package_revise", revise, timeout);
    xfer_log(fmt::format("ckan: activated dataset {}", dataset_id));
}

RemoteResource CkanClient::resource_info(const std::string& resource_id, int timeout) {
    RemoteResource r = parse_resource(get("resource_show", {{"id", resource_id}}, timeout));
    if (!r.dataset_id.empty()) {
        json pkg = package_show(r.dataset_id, timeout);
        r.dataset_name = pkg.value("name", r.dataset_id);
    }
    return r;
}

DownloadResult CkanClient::download_resource(const std::string& resource_id, bool condensed,
                                             int64_t offset, DownloadSink& sink, int timeout) {
    RemoteResource info = parse_resource(get("resource_show", {{"id", resource_id}}, api_timeout_));
    bool use_condensed = condensed && info.mimetype == RTDC_MIMETYPE;
    std::string url = use_condensed
        ? fmt::format(CKAN_CONDENSED_URL, server_, info.dataset_id, resource_id)
        : fmt::format(CKAN_DOWNLOAD_URL, server_, info.dataset_id, resource_id,
                      HttpClient::escape(info.name));

    auto resp = http_.get_range(url, offset, sink, timeout);
    if (resp.status != 200 && resp.status != 206) {
        ErrorKind kind = classify_http_status(resp.status);
        if (resp.status == 416) kind = ErrorKind::VerificationMismatch;   // local file longer than remote
        throw TransferError(kind, fmt::format("download of {} failed: HTTP {}", resource_id, resp.status));
    }

    DownloadResult result;
    result.offset = offset;
    result.etag = resp.header("etag");
    // The condensed file is generated on the server; its size is not in the resource
    result.total = use_condensed ? -1 : info.size;
    // Content-Range: bytes 100-199/200
    std::string cr = resp.header("content-range");
    auto slash = cr.rfind('/');
    if (slash != std::string::npos) {
        result.total = safe_stoll(cr.substr(slash + 1), result.total);
    }
    return result;
}

std::optional<std::string> CkanClient::query_resource_hash(const std::string& resource_id,
                                                           int timeout) {
    RemoteResource r = parse_resource(get("resource_show", {{"id", resource_id}}, timeout));
    if (r.sha256.empty()) return std::nullopt;
    return r.sha256;
}
