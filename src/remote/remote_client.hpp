#pragma once

#include <string>
#include <map>
#include <optional>
#include <cstdint>
#include <cstddef>

// What the repository knows about one resource.
struct RemoteResource {
    std::string id;
    std::string name;
    std::string dataset_id;
    std::string dataset_name;
    int64_t size = -1;
    std::string sha256;     // empty until the server has computed it
    std::string etag;
    std::string mimetype;
    std::map<std::string, std::string> supplements;   // "sp:section:key" -> JSON value text
};

struct ResourceMetadata {
    std::string name;
    std::string replace_id;                           // patch this resource instead of creating
};

// Byte source for uploads. read() returns 0 at end of data and may throw
// TransferInterrupted to stop the transfer at a chunk boundary.
class UploadSource {
public:
    virtual ~UploadSource() = default;
    virtual int64_t size() const = 0;
    virtual size_t read(char* buf, size_t len) = 0;
};

// Byte sink for downloads. write() may throw TransferInterrupted.
class DownloadSink {
public:
    virtual ~DownloadSink() = default;
    virtual void write(const char* data, size_t len) = 0;
};

struct DownloadResult {
    int64_t offset = 0;     // first byte delivered to the sink
    int64_t total = -1;     // full resource size, if the server said so
    std::string etag;
};

// Calls the transfer pipeline makes against the repository.
//
// Every call takes an explicit timeout in seconds. For the streaming
// calls (create_or_patch_resource, download_resource) it is a stall
// window: the call fails if no byte moves for that long.
//
// Failures are thrown as TransferError: ConnectionError for transient
// problems, AuthorizationError, InvalidTask, RemoteStateVanished for
// permanent ones.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    // False for deleted or never-existing datasets.
    virtual bool dataset_exists(const std::string& dataset_id, int timeout) = 0;

    // Creates a draft dataset from a JSON dataset dictionary; returns its id.
    virtual std::string create_draft_dataset(const std::string& dataset_json, int timeout) = 0;

    virtual std::optional<RemoteResource> find_resource(const std::string& dataset_id,
                                                        const std::string& resource_name,
                                                        int timeout) = 0;

    virtual bool resource_exists(const std::string& dataset_id, const std::string& resource_name,
                                 int timeout) {
        return find_resource(dataset_id, resource_name, timeout).has_value();
    }

    virtual RemoteResource create_or_patch_resource(const std::string& dataset_id,
                                                    const ResourceMetadata& metadata,
                                                    UploadSource& source, int timeout) = 0;

    // Sets schema supplements on an existing resource; other keys are kept.
    virtual void update_resource_supplements(const std::string& dataset_id,
                                             const std::string& resource_id,
                                             const std::map<std::string, std::string>& supplements,
                                             int timeout) = 0;

    virtual void activate_dataset(const std::string& dataset_id, int timeout) = 0;

    virtual RemoteResource resource_info(const std::string& resource_id, int timeout) = 0;

    // Streams bytes [offset, end) into `sink`. With `condensed`, an RT-DC
    // resource is served in its condensed form.
    virtual DownloadResult download_resource(const std::string& resource_id, bool condensed,
                                             int64_t offset, DownloadSink& sink, int timeout) = 0;

    // Server-side SHA-256, absent while the server has not computed it.
    virtual std::optional<std::string> query_resource_hash(const std::string& resource_id,
                                                           int timeout) = 0;
};
