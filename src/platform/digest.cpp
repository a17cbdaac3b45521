#include "hatch/digest.hpp"

#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace hatch {

namespace {

struct MdCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxFree>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string out(len * 2, '0');
    for (unsigned int i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return out;
}

} // namespace

HashResult compute_file_sha256(const std::string& file_path) {
    HashResult result;

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        result.error = "cannot open for hashing: " + file_path;
        return result;
    }

    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "sha256 context setup failed";
        return result;
    }

    char chunk[16384];
    while (in.read(chunk, sizeof(chunk)) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), chunk, static_cast<size_t>(in.gcount())) != 1) {
            result.error = "sha256 update failed for " + file_path;
            return result;
        }
    }
    if (in.bad()) {
        result.error = "read error while hashing: " + file_path;
        return result;
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        result.error = "sha256 finalize failed for " + file_path;
        return result;
    }

    result.hex_digest = to_hex(md, md_len);
    result.ok = true;
    return result;
}

} // namespace hatch
