#include "seeded_byte_stream.h"
#include "crypto_helper.h"
#include "errors.h"

#include <algorithm> // For std::copy, std::min

SeededByteStream::SeededByteStream(const std::string& seed, std::size_t capacity) {
    if (capacity < BLOCK_SIZE || capacity % BLOCK_SIZE != 0) {
        throw SeedExpansionError("stream capacity must be a non-zero multiple of " +
                                 std::to_string(BLOCK_SIZE) + " bytes, got " +
                                 std::to_string(capacity));
    }

    buffer.assign(capacity, 0);

    Bytes initial = CryptoHelper::sha256Bytes(seed);
    std::copy(initial.begin(), initial.end(), buffer.begin());

    // Each block is the hash of the block immediately before it.
    for (std::size_t i = BLOCK_SIZE; i < capacity; i += BLOCK_SIZE) {
        Bytes block = CryptoHelper::sha256Bytes(buffer.data() + i - BLOCK_SIZE, BLOCK_SIZE);
        std::copy(block.begin(), block.end(), buffer.begin() + static_cast<std::ptrdiff_t>(i));
    }
}

void SeededByteStream::recycle() {
    // Only the first block is replaced; bytes [32, capacity) keep their previous contents.
    Bytes next = CryptoHelper::sha256Bytes(buffer);
    std::copy(next.begin(), next.end(), buffer.begin());
    offset = 0;
}

std::vector<unsigned char> SeededByteStream::read(std::size_t n) {
    std::vector<unsigned char> out;
    out.reserve(n);

    while (out.size() < n) {
        if (offset >= buffer.size()) {
            recycle();
        }
        std::size_t chunk = std::min(n - out.size(), buffer.size() - offset);
        auto begin = buffer.begin() + static_cast<std::ptrdiff_t>(offset);
        out.insert(out.end(), begin, begin + static_cast<std::ptrdiff_t>(chunk));
        offset += chunk;
    }

    consumed += n;
    return out;
}
