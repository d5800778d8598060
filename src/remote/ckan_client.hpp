#pragma once

#include <string>
#include <map>
#include <core/types.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include "remote_client.hpp"
#include "http_client.hpp"

// RemoteClient for a CKAN action API (https://<server>/api/3/action/).
class CkanClient : public RemoteClient {
public:
    CkanClient(const ServerConfig& server, const TransferConfig& transfer);

    bool dataset_exists(const std::string& dataset_id, int timeout) override;
    std::string create_draft_dataset(const std::string& dataset_json, int timeout) override;
    std::optional<RemoteResource> find_resource(const std::string& dataset_id,
                                                const std::string& resource_name,
                                                int timeout) override;
    RemoteResource create_or_patch_resource(const std::string& dataset_id,
                                            const ResourceMetadata& metadata,
                                            UploadSource& source, int timeout) override;
    void update_resource_supplements(const std::string& dataset_id,
                                     const std::string& resource_id,
                                     const std::map<std::string, std::string>& supplements,
                                     int timeout) override;
    void activate_dataset(const std::string& dataset_id, int timeout) override;
    RemoteResource resource_info(const std::string& resource_id, int timeout) override;
    DownloadResult download_resource(const std::string& resource_id, bool condensed,
                                     int64_t offset, DownloadSink& sink, int timeout) override;
    std::optional<std::string> query_resource_hash(const std::string& resource_id,
                                                   int timeout) override;

    // "https://host" -> "https://host/api/3/action/"; adds https:// if missing.
    static std::string api_url(const std::string& server);

    // HTTP status -> error kind for a failed call.
    static ErrorKind classify_http_status(long status);

    // Unwrap {"success": true, "result": ...} or throw a classified TransferError.
    static nlohmann::json unwrap(long status, const std::string& body, const std::string& action);

    static RemoteResource parse_resource(const nlohmann::json& res);

private:
    std::string server_;
    std::string api_url_;
    int api_timeout_;
    HttpClient http_;

    nlohmann::json get(const std::string& action,
                       const std::map<std::string, std::string>& params, int timeout);
    nlohmann::json post(const std::string& action, const nlohmann::json& body, int timeout);
    nlohmann::json package_show(const std::string& dataset_id, int timeout);
};
