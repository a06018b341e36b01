#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lexport::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

// AES-256-GCM without AAD. The returned blob is ciphertext followed by the
// 16-byte tag.
Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const std::uint8_t* plaintext, std::size_t plaintext_len);
Bytes AesGcmEncryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& plaintext);

// Throws AuthenticationError when the tag does not verify.
Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const std::uint8_t* blob, std::size_t blob_len);
Bytes AesGcmDecryptWithIv(const Bytes& key, const Bytes& iv, const Bytes& blob);

Bytes Sha256(const std::uint8_t* data, std::size_t len);

void Wipe(Bytes& secret) noexcept;

}  // namespace lexport::crypto
