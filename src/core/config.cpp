#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".repoxfer";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# repoxfer configuration

server:
  url: "https://dcor.mpl.mpg.de"
  api_key: ""                      # or set REPOXFER_API_KEY
  ssl_verify: true

transfer:
  upload_workers: 2
  download_workers: 2
  chunk_size: 1048576              # bytes per read/write
  max_attempts: 10                 # per job, for transient failures
  backoff_base_ms: 2000            # doubles per attempt
  backoff_cap_ms: 300000
  api_timeout: 30                  # seconds
  stream_timeout: 120              # seconds without progress before a stream is dropped
  activate_timeout: 600

cache:
  dir: "cache"                     # relative to ~/.repoxfer
  max_size_gb: 20
  compress_suffixes: [".rtdc", ".dc"]

registry:
  dir: "jobs"

logging:
  dir: "logs"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static std::string resolve_dir(const fs::path& base, const std::string& value,
                               const std::string& fallback) {
    fs::path p = value.empty() ? fs::path(fallback) : fs::path(value);
    if (!p.empty() && p.string()[0] == '~') {
        p = platform::home_dir() / p.string().substr(p.string().size() > 1 ? 2 : 1);
    }
    if (p.is_relative()) p = base / p;
    return p.lexically_normal().string();
}

static ServerConfig parse_server_config(const YAML::Node& node) {
    ServerConfig s;
    s.url = node["url"].as<std::string>("");
    s.api_key = node["api_key"].as<std::string>("");
    s.ssl_verify = node["ssl_verify"].as<bool>(true);
    s.ca_bundle = node["ca_bundle"].as<std::string>("");

    while (!s.url.empty() && s.url.back() == '/') s.url.pop_back();
    if (!s.url.empty() && s.url.find("://") == std::string::npos) {
        s.url = "https://" + s.url;
    }
    return s;
}

static TransferConfig parse_transfer_config(const YAML::Node& node) {
    TransferConfig t;
    t.upload_workers = node["upload_workers"].as<int>(t.upload_workers);
    t.download_workers = node["download_workers"].as<int>(t.download_workers);
    t.chunk_size = node["chunk_size"].as<int64_t>(t.chunk_size);
    t.persist_interval = node["persist_interval"].as<int64_t>(t.persist_interval);
    t.max_attempts = node["max_attempts"].as<int>(t.max_attempts);
    t.backoff_base_ms = node["backoff_base_ms"].as<int>(t.backoff_base_ms);
    t.backoff_cap_ms = node["backoff_cap_ms"].as<int>(t.backoff_cap_ms);
    t.backoff_jitter = node["backoff_jitter"].as<double>(t.backoff_jitter);
    t.api_timeout = node["api_timeout"].as<int>(t.api_timeout);
    t.connect_timeout = node["connect_timeout"].as<int>(t.connect_timeout);
    t.stream_timeout = node["stream_timeout"].as<int>(t.stream_timeout);
    t.activate_timeout = node["activate_timeout"].as<int>(t.activate_timeout);
    t.poll_interval_ms = node["poll_interval_ms"].as<int>(t.poll_interval_ms);
    t.disk_recheck_ms = node["disk_recheck_ms"].as<int>(t.disk_recheck_ms);
    t.verify_poll_ms = node["verify_poll_ms"].as<int>(t.verify_poll_ms);
    t.verify_max_polls = node["verify_max_polls"].as<int>(t.verify_max_polls);
    return t;
}

static CacheConfig parse_cache_config(const YAML::Node& node, const fs::path& base) {
    CacheConfig c;
    c.dir = resolve_dir(base, node["dir"].as<std::string>(""), "cache");
    if (node["max_size_gb"]) {
        double gb = node["max_size_gb"].as<double>(20.0);
        c.max_bytes = static_cast<int64_t>(gb * 1024.0 * 1024.0 * 1024.0);
    }
    if (node["max_bytes"]) {
        c.max_bytes = node["max_bytes"].as<int64_t>(c.max_bytes);
    }

    // compress_suffixes accepts a single string or a list
    auto sfx = node["compress_suffixes"];
    if (sfx && sfx.IsSequence()) {
        for (const auto& s : sfx) c.compress_suffixes.push_back(s.as<std::string>());
    } else if (sfx && sfx.IsScalar()) {
        c.compress_suffixes.push_back(sfx.as<std::string>());
    } else if (!sfx) {
        c.compress_suffixes = {".rtdc", ".dc"};
    }
    return c;
}

static Result<void> validate(const Config& cfg) {
    const auto& t = cfg.transfer();
    if (t.upload_workers < 1 || t.download_workers < 1) {
        return Result<void>::Err("transfer: worker counts must be at least 1");
    }
    if (t.chunk_size < 4096) {
        return Result<void>::Err(fmt::format("transfer: chunk_size {} is too small", t.chunk_size));
    }
    if (t.max_attempts < 1) {
        return Result<void>::Err("transfer: max_attempts must be at least 1");
    }
    if (t.backoff_base_ms < 0 || t.backoff_cap_ms < t.backoff_base_ms) {
        return Result<void>::Err("transfer: backoff_cap_ms must be >= backoff_base_ms >= 0");
    }
    if (t.backoff_jitter < 0.0 || t.backoff_jitter >= 1.0) {
        return Result<void>::Err("transfer: backoff_jitter must be in [0, 1)");
    }
    if (t.api_timeout <= 0 || t.stream_timeout <= 0 || t.activate_timeout <= 0) {
        return Result<void>::Err("transfer: timeouts must be positive");
    }
    if (cfg.cache().max_bytes <= 0) {
        return Result<void>::Err("cache: max size must be positive");
    }
    return Result<void>::Ok();
}

static void apply_env_overrides(Config& cfg) {
    const char* key = std::getenv(API_KEY_ENV);
    if (key && *key) {
        cfg.server().api_key = key;
    }
}

Config Config::defaults(const fs::path& base_dir) {
    Config cfg;
    cfg.cache_ = parse_cache_config(YAML::Node(), base_dir);
    cfg.storage_.registry_dir = resolve_dir(base_dir, "", "jobs");
    cfg.storage_.log_dir = resolve_dir(base_dir, "", "logs");
    cfg.storage_.task_map_path = resolve_dir(base_dir, "", "task_datasets.txt");
    return cfg;
}

Result<Config> Config::load_file(const fs::path& path) {
    fs::path base = path.parent_path();
    if (base.empty()) base = fs::current_path();

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config cfg;

        cfg.server_ = parse_server_config(root["server"]);
        cfg.transfer_ = parse_transfer_config(root["transfer"]);
        cfg.cache_ = parse_cache_config(root["cache"], base);
        cfg.storage_.registry_dir = resolve_dir(base, root["registry"]["dir"].as<std::string>(""), "jobs");
        cfg.storage_.log_dir = resolve_dir(base, root["logging"]["dir"].as<std::string>(""), "logs");
        cfg.storage_.task_map_path = resolve_dir(
            base, root["registry"]["task_map"].as<std::string>(""), "task_datasets.txt");

        apply_env_overrides(cfg);

        auto ok = validate(cfg);
        if (ok.is_err()) {
            return Result<Config>::Err(fmt::format("{}: {}", path.string(), ok.error));
        }
        return Result<Config>::Ok(cfg);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        Config cfg = defaults(get_global_config_dir());
        apply_env_overrides(cfg);
        return Result<Config>::Ok(cfg);
    }
    return load_file(get_global_config_path());
}

bool Config::should_compress(const std::string& resource_path) const {
    // Already gzip-compressed payloads go up as they are
    if (ends_with_ci(resource_path, ".gz")) return false;
    for (const auto& sfx : cache_.compress_suffixes) {
        if (ends_with_ci(resource_path, sfx)) return true;
    }
    return false;
}
