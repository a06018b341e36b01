#include "lexport/crypto.hpp"

#include "lexport/constants.hpp"
#include "lexport/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>

namespace lexport::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

void CheckGcmInputs(const Bytes& key, const Bytes& iv, std::size_t len) {
    if (key.size() != constants::kKeyLen) {
        throw std::runtime_error("AES-GCM expects 32-byte key");
    }
    if (iv.size() != constants::kNonceLen) {
        throw std::runtime_error("AES-GCM expects 12-byte IV");
    }
    if (len > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("AES-GCM input too large");
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const std::uint8_t* plaintext, std::size_t plaintext_len) {
    CheckGcmInputs(key, iv, plaintext_len);
    Bytes out(plaintext_len + constants::kTagLen);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;

    try {
        Ensure(EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
               "AES-GCM init failed");
        Ensure(EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
               "AES-GCM set iv length failed");
        Ensure(EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) == 1,
               "AES-GCM set key failed");
        if (plaintext_len > 0) {
            Ensure(EVP_EncryptUpdate(ctx, out.data(), &out_len, plaintext,
                                     static_cast<int>(plaintext_len)) == 1,
                   "AES-GCM encrypt failed");
            total_len += out_len;
        }
        Ensure(EVP_EncryptFinal_ex(ctx, out.data() + total_len, &out_len) == 1,
               "AES-GCM final failed");
        total_len += out_len;
        Ensure(EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(constants::kTagLen),
                                   out.data() + total_len) == 1,
               "AES-GCM get tag failed");
    } catch (...) {
        EVP_CIPHER_CTX_free(ctx);
        throw;
    }

    EVP_CIPHER_CTX_free(ctx);
    out.resize(static_cast<std::size_t>(total_len) + constants::kTagLen);
    return out;
}

Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& plaintext) {
    return AesGcmEncryptWithIv(key, iv, plaintext.data(), plaintext.size());
}

Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const std::uint8_t* blob, std::size_t blob_len) {
    CheckGcmInputs(key, iv, blob_len);
    if (blob_len < constants::kTagLen) {
        throw AuthenticationError();
    }
    std::size_t ct_len = blob_len - constants::kTagLen;
    Bytes tag(blob + ct_len, blob + blob_len);
    Bytes plaintext(ct_len);

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        throw std::runtime_error("AES-GCM context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;
    bool authentic = false;

    try {
        Ensure(EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1,
               "AES-GCM init failed");
        Ensure(EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(iv.size()), nullptr) == 1,
               "AES-GCM set iv length failed");
        Ensure(EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) == 1,
               "AES-GCM set key failed");
        if (ct_len > 0) {
            Ensure(EVP_DecryptUpdate(ctx, plaintext.data(), &out_len, blob,
                                     static_cast<int>(ct_len)) == 1,
                   "AES-GCM decrypt failed");
            total_len += out_len;
        }
        Ensure(EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
               "AES-GCM set tag failed");
        authentic = EVP_DecryptFinal_ex(ctx, plaintext.data() + total_len, &out_len) == 1;
        total_len += out_len;
    } catch (...) {
        EVP_CIPHER_CTX_free(ctx);
        throw;
    }

    EVP_CIPHER_CTX_free(ctx);
    if (!authentic) {
        Wipe(plaintext);
        throw AuthenticationError();
    }
    plaintext.resize(static_cast<std::size_t>(total_len));
    return plaintext;
}

Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& blob) {
    return AesGcmDecryptWithIv(key, iv, blob.data(), blob.size());
}

Bytes Sha256(const std::uint8_t* data, std::size_t len) {
    const EVP_MD* md = EVP_sha256();
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("SHA-256 context allocation failed");
    }
    unsigned int out_len = 0;
    Bytes out(static_cast<std::size_t>(EVP_MD_size(md)));
    try {
        Ensure(EVP_DigestInit_ex(ctx, md, nullptr) == 1, "SHA-256 init failed");
        if (len > 0) {
            Ensure(EVP_DigestUpdate(ctx, data, len) == 1, "SHA-256 update failed");
        }
        Ensure(EVP_DigestFinal_ex(ctx, out.data(), &out_len) == 1, "SHA-256 final failed");
    } catch (...) {
        EVP_MD_CTX_free(ctx);
        throw;
    }
    EVP_MD_CTX_free(ctx);
    out.resize(out_len);
    return out;
}

void Wipe(Bytes& secret) noexcept {
    if (!secret.empty()) {
        OPENSSL_cleanse(secret.data(), secret.size());
    }
    secret.clear();
}

}  // namespace lexport::crypto
