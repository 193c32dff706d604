#ifndef SEEDED_BYTE_STREAM_H
#define SEEDED_BYTE_STREAM_H

#include <string>
#include <vector>
#include <cstddef>

/**
 * @brief Deterministic byte stream expanded from a string seed by SHA-256 chaining.
 *
 * The buffer starts as SHA-256(seed) followed by a hash chain where every 32-byte block is
 * the hash of the block before it. When the cursor reaches the end, the first 32 bytes are
 * overwritten with SHA-256(whole buffer) and reading restarts at offset 0; the remaining
 * bytes of the buffer are left unchanged.
 *
 * This is NOT a CSPRNG. Every byte is a pure function of the seed and the number of bytes
 * already read, which is what makes derived identities reproducible.
 */
class SeededByteStream {
public:
    static constexpr std::size_t BLOCK_SIZE = 32;
    static constexpr std::size_t DEFAULT_CAPACITY = 8192;

    /**
     * @brief Expands the seed into a full buffer.
     * @param seed Arbitrary bytes; an empty seed is accepted.
     * @param capacity Buffer size in bytes. Must be a non-zero multiple of 32.
     * @throws SeedExpansionError if the capacity is invalid.
     */
    explicit SeededByteStream(const std::string& seed, std::size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Returns exactly n bytes, recycling the buffer as many times as needed.
     */
    std::vector<unsigned char> read(std::size_t n);

    std::size_t capacity() const { return buffer.size(); }
    std::size_t bytesConsumed() const { return consumed; }

private:
    std::vector<unsigned char> buffer;
    std::size_t offset = 0;
    std::size_t consumed = 0;

    void recycle();
};

#endif // SEEDED_BYTE_STREAM_H
