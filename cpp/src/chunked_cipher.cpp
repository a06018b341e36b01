#include "lexport/chunked_cipher.hpp"

#include "lexport/constants.hpp"
#include "lexport/crypto.hpp"
#include "lexport/errors.hpp"
#include "lexport/format.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace lexport::cipher {

namespace {

Bytes DeriveKey(const std::string& password, const Bytes& salt) {
    return crypto::Pbkdf2HmacSha256(password, salt, constants::KdfIterations(), constants::kKeyLen);
}

std::size_t ResolveChunkSize(std::size_t chunk_size) {
    std::size_t resolved = chunk_size > 0 ? chunk_size : constants::kCipherChunkSize;
    if (resolved > static_cast<std::size_t>(std::numeric_limits<std::uint32_t>::max()) - constants::kTagLen) {
        throw std::runtime_error("Cipher chunk size too large");
    }
    return resolved;
}

}  // namespace

ChunkedCipherWriter::ChunkedCipherWriter(stream::ByteSink& downstream,
                                         const std::string& password,
                                         std::size_t chunk_size)
    : downstream_(downstream),
      password_(password),
      chunk_size_(ResolveChunkSize(chunk_size)) {
    if (password_.empty()) {
        throw std::runtime_error("Password required for encrypted export");
    }
}

ChunkedCipherWriter::~ChunkedCipherWriter() {
    crypto::Wipe(key_);
    crypto::Wipe(residual_);
}

void ChunkedCipherWriter::Start() {
    if (state_ != State::Uninitialized) {
        throw std::runtime_error("ChunkedCipherWriter already started");
    }
    Bytes salt = crypto::RandomBytes(constants::kSaltLen);
    Bytes preamble;
    preamble.reserve(constants::kStreamPreambleLen);
    preamble.insert(preamble.end(), constants::kEncryptionSignature.begin(), constants::kEncryptionSignature.end());
    preamble.insert(preamble.end(), salt.begin(), salt.end());
    downstream_.Write(preamble);

    key_ = DeriveKey(password_, salt);
    EmitChunk(nullptr, 0);
    residual_.reserve(chunk_size_);
    state_ = State::Started;
}

void ChunkedCipherWriter::Write(const std::uint8_t* data, std::size_t len) {
    if (state_ == State::Closed) {
        throw std::runtime_error("ChunkedCipherWriter already closed");
    }
    if (state_ == State::Uninitialized) {
        Start();
    }
    state_ = State::Transforming;
    std::size_t offset = 0;
    while (offset < len) {
        std::size_t take = std::min(len - offset, chunk_size_ - residual_.size());
        residual_.insert(residual_.end(), data + offset, data + offset + take);
        offset += take;
        if (residual_.size() == chunk_size_) {
            EmitChunk(residual_.data(), residual_.size());
            residual_.clear();
        }
    }
}

void ChunkedCipherWriter::Close() {
    if (state_ == State::Closed) {
        throw std::runtime_error("ChunkedCipherWriter already closed");
    }
    if (state_ == State::Uninitialized) {
        Start();
    }
    EmitChunk(residual_.data(), residual_.size());
    crypto::Wipe(residual_);
    crypto::Wipe(key_);
    state_ = State::Closed;
    downstream_.Close();
}

void ChunkedCipherWriter::Abort(const std::string& reason) noexcept {
    state_ = State::Closed;
    crypto::Wipe(residual_);
    crypto::Wipe(key_);
    downstream_.Abort(reason);
}

void ChunkedCipherWriter::EmitChunk(const std::uint8_t* data, std::size_t len) {
    Bytes nonce = crypto::RandomBytes(constants::kNonceLen);
    Bytes ct = crypto::AesGcmEncryptWithIv(key_, nonce, data, len);
    Bytes frame;
    frame.reserve(constants::kChunkHeaderLen + ct.size());
    frame.insert(frame.end(), nonce.begin(), nonce.end());
    format::AppendU32Le(frame, static_cast<std::uint32_t>(ct.size()));
    frame.insert(frame.end(), ct.begin(), ct.end());
    downstream_.Write(frame);
    chunks_emitted_ += 1;
}

ChunkedCipherReader::ChunkedCipherReader(stream::ByteSource& source,
                                         const std::string& password,
                                         std::size_t max_chunk_size,
                                         bool tolerate_truncation)
    : reader_(source),
      password_(password),
      max_chunk_size_(ResolveChunkSize(max_chunk_size)),
      tolerate_truncation_(tolerate_truncation) {}

ChunkedCipherReader::~ChunkedCipherReader() {
    crypto::Wipe(key_);
    crypto::Wipe(plain_);
}

void ChunkedCipherReader::ReadPreamble() {
    if (!reader_.Ensure(constants::kStreamPreambleLen)) {
        throw FormatError("File too small");
    }
    Bytes signature = reader_.Consume(constants::kEncryptionSignature.size());
    if (!std::equal(signature.begin(), signature.end(), constants::kEncryptionSignature.begin())) {
        throw FormatError("Not an encrypted archive");
    }
    Bytes salt = reader_.Consume(constants::kSaltLen);
    key_ = DeriveKey(password_, salt);
}

void ChunkedCipherReader::Open() {
    if (opened_) {
        return;
    }
    ReadPreamble();
    opened_ = true;
    if (!NextChunk()) {
        throw FormatError("Missing verification chunk");
    }
}

bool ChunkedCipherReader::NextChunk() {
    if (finished_) {
        return false;
    }
    if (!reader_.Ensure(constants::kChunkHeaderLen)) {
        if (reader_.Buffered() > 0) {
            return EndTruncated();
        }
        finished_ = true;
        crypto::Wipe(key_);
        return false;
    }
    Bytes nonce = reader_.Consume(constants::kNonceLen);
    std::uint8_t raw_len[constants::kLengthFieldLen];
    reader_.ConsumeInto(raw_len, sizeof(raw_len));
    std::uint32_t ct_len = format::ReadU32Le(raw_len);
    if (ct_len < constants::kTagLen || ct_len > max_chunk_size_ + constants::kTagLen) {
        throw FormatError("Corrupt chunk");
    }
    if (!reader_.Ensure(ct_len)) {
        return EndTruncated();
    }
    Bytes ct = reader_.Consume(ct_len);
    crypto::Wipe(plain_);
    plain_ = crypto::AesGcmDecryptWithIv(key_, nonce, ct);
    plain_pos_ = 0;
    chunks_decrypted_ += 1;
    return true;
}

// The verification chunk must always be complete.
bool ChunkedCipherReader::EndTruncated() {
    if (!tolerate_truncation_ || chunks_decrypted_ == 0) {
        throw FormatError("Corrupt chunk");
    }
    finished_ = true;
    crypto::Wipe(key_);
    return false;
}

std::size_t ChunkedCipherReader::Read(std::uint8_t* out, std::size_t len) {
    if (len == 0) {
        return 0;
    }
    Open();
    while (plain_pos_ >= plain_.size()) {
        if (!NextChunk()) {
            return 0;
        }
    }
    std::size_t take = std::min(len, plain_.size() - plain_pos_);
    std::memcpy(out, plain_.data() + plain_pos_, take);
    plain_pos_ += take;
    return take;
}

Bytes EncryptBuffer(const Bytes& plaintext, const std::string& password, std::size_t chunk_size) {
    stream::MemorySink sink;
    ChunkedCipherWriter writer(sink, password, chunk_size);
    writer.Write(plaintext);
    writer.Close();
    return sink.Take();
}

Bytes DecryptBuffer(const Bytes& blob, const std::string& password, std::size_t chunk_size) {
    stream::MemorySource source(blob);
    ChunkedCipherReader reader(source, password, chunk_size);
    reader.Open();
    return stream::ReadAll(reader);
}

}  // namespace lexport::cipher
