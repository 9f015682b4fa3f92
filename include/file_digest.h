// include/file_digest.h
// SHA-256 of files on disk via OpenSSL EVP

#ifndef FILE_DIGEST_H
#define FILE_DIGEST_H

#include <openssl/evp.h>
#include <syslog.h>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace TvBridge {

/**
 * Hex-encoded SHA-256 of a file, or an empty string if the file cannot be
 * read or the digest fails.
 */
inline std::string sha256_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        syslog(LOG_WARNING, "sha256_file: cannot open %s", path.c_str());
        return "";
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        syslog(LOG_ERR, "sha256_file: Failed to create digest context");
        return "";
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        syslog(LOG_ERR, "sha256_file: DigestInit failed");
        return "";
    }

    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            syslog(LOG_ERR, "sha256_file: DigestUpdate failed for %s", path.c_str());
            return "";
        }
    }
    if (in.bad()) {
        syslog(LOG_WARNING, "sha256_file: read error on %s", path.c_str());
        return "";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        syslog(LOG_ERR, "sha256_file: DigestFinal failed");
        return "";
    }

    static const char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(HEX[digest[i] >> 4]);
        hex.push_back(HEX[digest[i] & 0x0F]);
    }
    return hex;
}

} // namespace TvBridge

#endif // FILE_DIGEST_H
