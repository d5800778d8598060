#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.repoxfer/config.yaml (defaults if absent)
    static Result<Config> load_global();

    // Load from an explicit path; relative directories resolve against its parent.
    static Result<Config> load_file(const fs::path& path);

    // Config with every default filled in, rooted at `base_dir`.
    static Config defaults(const fs::path& base_dir);

    // Accessors
    const ServerConfig& server() const { return server_; }
    const TransferConfig& transfer() const { return transfer_; }
    const CacheConfig& cache() const { return cache_; }
    const StorageConfig& storage() const { return storage_; }

    // Mutable access for embedding hosts and tests
    ServerConfig& server() { return server_; }
    TransferConfig& transfer() { return transfer_; }
    CacheConfig& cache() { return cache_; }
    StorageConfig& storage() { return storage_; }

    // True when the resource should be gzip-compressed before upload.
    bool should_compress(const std::string& resource_path) const;

public:
    Config() = default;

private:
    ServerConfig server_;
    TransferConfig transfer_;
    CacheConfig cache_;
    StorageConfig storage_;
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
