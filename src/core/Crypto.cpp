#include "Crypto.hpp"

#include "../debug/log.hpp"

#include <cstdint>
#include <vector>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>

CCrypto::CCrypto(const std::string& key) : m_key(key) {
    ;
}

bool CCrypto::hasKey() const {
    return !m_key.empty();
}

std::string CCrypto::hmacSha1(const std::string& in) const {
    EVP_MAC* mac = EVP_MAC_fetch(nullptr, "HMAC", nullptr);
    if (!mac) {
        Debug::log(ERR, "CCrypto::hmacSha1: EVP_MAC_fetch: err {}", ERR_error_string(ERR_get_error(), nullptr));
        return "";
    }

    EVP_MAC_CTX* ctx = EVP_MAC_CTX_new(mac);
    if (!ctx) {
        EVP_MAC_free(mac);
        return "";
    }

    char       digest[] = "SHA1";
    OSSL_PARAM params[] = {OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest, 0), OSSL_PARAM_construct_end()};

    if (!EVP_MAC_init(ctx, (const unsigned char*)m_key.data(), m_key.size(), params)) {
        Debug::log(ERR, "CCrypto::hmacSha1: EVP_MAC_init: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);
        return "";
    }

    if (!EVP_MAC_update(ctx, (const unsigned char*)in.c_str(), in.size())) {
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);
        return "";
    }

    uint8_t buf[EVP_MAX_MD_SIZE];
    size_t  len = 0;

    if (!EVP_MAC_final(ctx, buf, &len, sizeof(buf))) {
        EVP_MAC_CTX_free(ctx);
        EVP_MAC_free(mac);
        return "";
    }

    EVP_MAC_CTX_free(ctx);
    EVP_MAC_free(mac);

    return std::string{(const char*)buf, len};
}

std::string CCrypto::sign(const std::string& in) const {
    const auto MAC = hmacSha1(in);
    if (MAC.empty())
        return "";

    return base64Encode(MAC);
}

bool CCrypto::verifySignature(const std::string& in, const std::string& sig) const {
    if (sig.empty())
        return false;

    const auto EXPECTED = sign(in);
    if (EXPECTED.empty())
        return false;

    return constantTimeEquals(EXPECTED, sig);
}

std::string CCrypto::base64Encode(const std::string& in) {
    if (in.empty())
        return "";

    std::vector<uint8_t> buf;
    buf.resize(4 * ((in.size() + 2) / 3) + 1);

    const int LEN = EVP_EncodeBlock(buf.data(), (const unsigned char*)in.c_str(), in.size());
    if (LEN < 0)
        return "";

    return std::string{(const char*)buf.data(), (size_t)LEN};
}

std::expected<std::string, std::string> CCrypto::base64Decode(const std::string& in) {
    if (in.empty())
        return "";

    if (in.size() % 4 != 0)
        return std::unexpected("base64 length is not a multiple of 4");

    std::vector<uint8_t> buf;
    buf.resize(in.size() / 4 * 3 + 1);

    int len = EVP_DecodeBlock(buf.data(), (const unsigned char*)in.c_str(), in.size());
    if (len < 0)
        return std::unexpected("invalid base64");

    // EVP_DecodeBlock keeps the bytes produced by padding
    if (in.ends_with("=="))
        len -= 2;
    else if (in.ends_with("="))
        len -= 1;

    return std::string{(const char*)buf.data(), (size_t)len};
}

bool CCrypto::constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size())
        return false;

    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}
