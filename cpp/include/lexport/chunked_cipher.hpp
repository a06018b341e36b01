#pragma once

#include "lexport/buffer_reader.hpp"
#include "lexport/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lexport::cipher {

using Bytes = std::vector<std::uint8_t>;

// Encrypted stream layout:
//   "LE_ENC" | salt(16) | chunk*
//   chunk = nonce(12) | u32le ciphertext length | ciphertext || tag(16)
// The first chunk always carries an empty plaintext so a reader can reject a
// wrong password before touching real data.
class ChunkedCipherWriter : public stream::ByteSink {
public:
    enum class State {
        Uninitialized,
        Started,
        Transforming,
        Closed
    };

    ChunkedCipherWriter(stream::ByteSink& downstream, const std::string& password, std::size_t chunk_size = 0);
    ~ChunkedCipherWriter() override;

    ChunkedCipherWriter(const ChunkedCipherWriter&) = delete;
    ChunkedCipherWriter& operator=(const ChunkedCipherWriter&) = delete;

    using stream::ByteSink::Write;

    // Emits signature, salt and the verification chunk. Called implicitly by
    // the first Write or Close.
    void Start();
    void Write(const std::uint8_t* data, std::size_t len) override;
    void Close() override;
    void Abort(const std::string& reason) noexcept override;

    State state() const noexcept { return state_; }
    std::uint64_t chunks_emitted() const noexcept { return chunks_emitted_; }

private:
    void EmitChunk(const std::uint8_t* data, std::size_t len);

    stream::ByteSink& downstream_;
    std::string password_;
    std::size_t chunk_size_;
    State state_ = State::Uninitialized;
    Bytes key_;
    Bytes residual_;
    std::uint64_t chunks_emitted_ = 0;
};

// Lazily decrypts an encrypted stream one chunk at a time. Only one chunk of
// ciphertext and plaintext is held in memory.
class ChunkedCipherReader : public stream::ByteSource {
public:
    // With `tolerate_truncation`, a chunk cut off after the verification
    // chunk ends the stream instead of raising FormatError. The partial chunk
    // cannot be authenticated and is dropped.
    ChunkedCipherReader(stream::ByteSource& source,
                        const std::string& password,
                        std::size_t max_chunk_size = 0,
                        bool tolerate_truncation = false);
    ~ChunkedCipherReader() override;

    ChunkedCipherReader(const ChunkedCipherReader&) = delete;
    ChunkedCipherReader& operator=(const ChunkedCipherReader&) = delete;

    // Parses the preamble, derives the key and authenticates the first chunk.
    // Throws FormatError or AuthenticationError.
    void Open();
    std::size_t Read(std::uint8_t* out, std::size_t len) override;

    std::uint64_t chunks_decrypted() const noexcept { return chunks_decrypted_; }

private:
    void ReadPreamble();
    bool NextChunk();
    bool EndTruncated();

    stream::BufferReader reader_;
    std::string password_;
    std::size_t max_chunk_size_;
    bool tolerate_truncation_;
    Bytes key_;
    Bytes plain_;
    std::size_t plain_pos_ = 0;
    bool opened_ = false;
    bool finished_ = false;
    std::uint64_t chunks_decrypted_ = 0;
};

Bytes EncryptBuffer(const Bytes& plaintext, const std::string& password, std::size_t chunk_size = 0);
Bytes DecryptBuffer(const Bytes& blob, const std::string& password, std::size_t chunk_size = 0);

}  // namespace lexport::cipher
