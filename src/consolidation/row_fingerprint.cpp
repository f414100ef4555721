// EN: SHA-256 row fingerprints through the OpenSSL EVP interface.
// FR: Empreintes de ligne SHA-256 via l'interface EVP d'OpenSSL.

#include "consolidation/row_fingerprint.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace SHC {
namespace Consolidation {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

DigestContext newSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const std::string& data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string finishHex(EVP_MD_CTX* ctx) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, out, &out_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }

    static const char HEX[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(out_len * 2);
    for (unsigned int i = 0; i < out_len; ++i) {
        hex.push_back(HEX[out[i] >> 4]);
        hex.push_back(HEX[out[i] & 0x0F]);
    }
    return hex;
}

} // namespace

std::string fingerprintRow(const Sheets::Row& row) {
    auto ctx = newSha256Context();
    for (const auto& cell : row) {
        update(ctx.get(), cell);
    }
    return finishHex(ctx.get());
}

std::string sha256Hex(const std::string& data) {
    auto ctx = newSha256Context();
    update(ctx.get(), data);
    return finishHex(ctx.get());
}

} // namespace Consolidation
} // namespace SHC
