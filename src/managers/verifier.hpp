#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <filesystem>

struct evp_md_ctx_st;

struct Digests {
    std::string sha256;   // lowercase hex
    std::string md5;
};

// SHA-256 and MD5 in one pass, fed chunk by chunk while data streams.
class StreamHasher {
public:
    StreamHasher();
    ~StreamHasher();

    StreamHasher(const StreamHasher&) = delete;
    StreamHasher& operator=(const StreamHasher&) = delete;

    void update(const void* data, size_t len);
    Digests finish();

    int64_t bytes() const { return bytes_; }

private:
    evp_md_ctx_st* sha256_;
    evp_md_ctx_st* md5_;
    int64_t bytes_ = 0;
    bool finished_ = false;
};

// Feed the first `limit` bytes of a file (all if limit < 0) into `hasher`.
// `on_chunk` runs before every chunk and may throw to interrupt.
void hash_file_into(StreamHasher& hasher, const std::filesystem::path& path,
                    int64_t limit = -1, const std::function<void()>& on_chunk = nullptr);

Digests hash_file(const std::filesystem::path& path);

enum class TokenKind { ContentHash, ETag, None };

const char* token_kind_name(TokenKind k);

// Integrity tokens the server exposes for a resource. Empty when absent.
struct RemoteTokens {
    std::string sha256;
    std::string etag;
};

struct VerifyResult {
    bool available = false;   // false: the server has no usable token yet
    bool match = false;
    TokenKind kind = TokenKind::None;
    std::string computed;     // local token that was compared
    std::string expected;     // server token
    bool fell_back = false;   // ETag used because no content hash was exposed
};

// Prefers the content hash; falls back to the single-part ETag (MD5).
// Multipart ETags ("<hex>-<parts>") cannot be checked against a plain
// MD5 and count as unavailable.
VerifyResult verify_tokens(const Digests& local, const RemoteTokens& remote);

// Strip quotes/whitespace and lowercase.
std::string normalize_etag(const std::string& etag);
bool is_multipart_etag(const std::string& etag);
