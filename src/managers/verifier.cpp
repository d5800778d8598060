#include "verifier.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <openssl/evp.h>
#include <fstream>
#include <stdexcept>
#include <vector>

StreamHasher::StreamHasher()
    : sha256_(EVP_MD_CTX_new()), md5_(EVP_MD_CTX_new()) {
    if (!sha256_ || !md5_
        || EVP_DigestInit_ex(sha256_, EVP_sha256(), nullptr) != 1
        || EVP_DigestInit_ex(md5_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(sha256_);
        EVP_MD_CTX_free(md5_);
        throw std::runtime_error("OpenSSL digest initialization failed");
    }
}

StreamHasher::~StreamHasher() {
    EVP_MD_CTX_free(sha256_);
    EVP_MD_CTX_free(md5_);
}

void StreamHasher::update(const void* data, size_t len) {
    if (finished_) throw std::logic_error("StreamHasher::update after finish");
    if (len == 0) return;
    if (EVP_DigestUpdate(sha256_, data, len) != 1
        || EVP_DigestUpdate(md5_, data, len) != 1) {
        throw std::runtime_error("OpenSSL digest update failed");
    }
    bytes_ += static_cast<int64_t>(len);
}

Digests StreamHasher::finish() {
    if (finished_) throw std::logic_error("StreamHasher::finish called twice");
    finished_ = true;

    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    Digests d;
    if (EVP_DigestFinal_ex(sha256_, buf, &len) != 1) {
        throw std::runtime_error("OpenSSL digest final failed");
    }
    d.sha256 = to_hex(buf, len);
    if (EVP_DigestFinal_ex(md5_, buf, &len) != 1) {
        throw std::runtime_error("OpenSSL digest final failed");
    }
    d.md5 = to_hex(buf, len);
    return d;
}

void hash_file_into(StreamHasher& hasher, const std::filesystem::path& path,
                    int64_t limit, const std::function<void()>& on_chunk) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw TransferError(ErrorKind::ResourceUnavailable, "cannot read " + path.string());
    }

    std::vector<char> buf(CHUNK_SIZE_BYTES);
    int64_t remaining = limit;
    while (limit < 0 || remaining > 0) {
        if (on_chunk) on_chunk();
        std::streamsize want = static_cast<std::streamsize>(buf.size());
        if (limit >= 0 && remaining < want) want = static_cast<std::streamsize>(remaining);
        in.read(buf.data(), want);
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        hasher.update(buf.data(), static_cast<size_t>(got));
        if (limit >= 0) remaining -= got;
    }
    if (limit >= 0 && remaining > 0) {
        throw TransferError(ErrorKind::ResourceUnavailable,
                            "file shorter than expected: " + path.string());
    }
}

Digests hash_file(const std::filesystem::path& path) {
    StreamHasher h;
    hash_file_into(h, path);
    return h.finish();
}

const char* token_kind_name(TokenKind k) {
    switch (k) {
        case TokenKind::ContentHash: return "sha256";
        case TokenKind::ETag:        return "etag";
        case TokenKind::None:        return "";
    }
    return "";
}

std::string normalize_etag(const std::string& etag) {
    std::string s = etag;
    trim(s);
    if (s.rfind("W/", 0) == 0) s = s.substr(2);
    while (!s.empty() && (s.front() == '"' || s.front() == '\'')) s.erase(0, 1);
    while (!s.empty() && (s.back() == '"' || s.back() == '\'')) s.pop_back();
    return to_lower(s);
}

bool is_multipart_etag(const std::string& etag) {
    return normalize_etag(etag).find('-') != std::string::npos;
}

VerifyResult verify_tokens(const Digests& local, const RemoteTokens& remote) {
    VerifyResult r;

    std::string sha = to_lower(remote.sha256);
    trim(sha);
    if (!sha.empty()) {
        r.available = true;
        r.kind = TokenKind::ContentHash;
        r.expected = sha;
        r.computed = local.sha256;
        r.match = (r.computed == r.expected);
        return r;
    }

    std::string etag = normalize_etag(remote.etag);
    if (!etag.empty() && !is_multipart_etag(etag)) {
        r.available = true;
        r.kind = TokenKind::ETag;
        r.fell_back = true;
        r.expected = etag;
        r.computed = local.md5;
        r.match = (r.computed == r.expected);
    }
    return r;
}
