#include "checksum.hpp"
#include <memory>
#include <openssl/evp.h>
#include "lib.hpp"

std::string normalize_sql(const std::string& sql) {
    std::string out;
    out.reserve(sql.size());
    size_t start = 0;
    while (start <= sql.size()) {
        size_t end = sql.find('\n', start);
        bool last = end == std::string::npos;
        std::string line = sql.substr(start, last ? std::string::npos : end - start);
        size_t keep = line.find_last_not_of(" \t\r");
        line = keep == std::string::npos ? std::string() : line.substr(0, keep + 1);
        out += line;
        if (last) break;
        out += '\n';
        start = end + 1;
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1)
        THROW("SHA-256 digest failed");

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}
