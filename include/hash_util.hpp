#ifndef HASH_UTIL_H
#define HASH_UTIL_H

#include <cstdint>
#include <cstring>
#include <string>

/**
 * @class Fnv1aHasher
 * @brief Incremental 64-bit FNV-1a hash used for content-addressed cache keys.
 */
class Fnv1aHasher {
public:
    void addBytes(const void* data, size_t size) {
        const auto* bytes = static_cast<const unsigned char*>(data);
        for (size_t i = 0; i < size; ++i) {
            state ^= bytes[i];
            state *= 1099511628211ULL;
        }
    }

    void add(double value) {
        // +0.0 and -0.0 must hash alike
        if (value == 0.0) value = 0.0;
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        addBytes(&bits, sizeof(bits));
    }

    void add(int64_t value) { addBytes(&value, sizeof(value)); }

    void add(bool value) {
        unsigned char b = value ? 1 : 0;
        addBytes(&b, 1);
    }

    void add(const std::string& value) {
        add(static_cast<int64_t>(value.size()));
        addBytes(value.data(), value.size());
    }

    uint64_t digest() const { return state; }

private:
    uint64_t state = 14695981039346656037ULL;
};

#endif // HASH_UTIL_H
