/**
 * @file schema_version.cpp
 * @brief Schema version checksum
 */

#include <vigil/storage/schema_version.hpp>

#include <openssl/evp.h>

#include <array>
#include <memory>

namespace vigil::storage {

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

auto to_hex(const unsigned char* data, unsigned int size) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(static_cast<std::size_t>(size) * 2);
    for (unsigned int i = 0; i < size; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0f]);
    }
    return hex;
}

}  // namespace

auto schema_version::checksum() const -> std::string {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return {};
    }

    // Fields are separated by NUL so that moving text between them changes the digest
    const char separator = '\0';
    for (const std::string* part : {&id, &forward_script, &reverse_script}) {
        if (EVP_DigestUpdate(ctx.get(), part->data(), part->size()) != 1 ||
            EVP_DigestUpdate(ctx.get(), &separator, 1) != 1) {
            return {};
        }
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        return {};
    }
    return to_hex(digest.data(), digest_len);
}

}  // namespace vigil::storage
