#include "audiocache/cache_key.hpp"
#include "audiocache/errors.hpp"

#include <xxhash.h>

#include <cctype>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

namespace audiocache {

namespace {

constexpr std::uint8_t kKeyVersion = 1;

// Helper to append little-endian data to a vector
template <typename T>
void append_le(std::vector<std::uint8_t>& buf, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

// Length prefix keeps ("ab", "c") and ("a", "bc") apart.
void append_field(std::vector<std::uint8_t>& buf, const std::string& field) {
    if (field.size() > UINT32_MAX) {
        throw Error("Cache key field is too long.");
    }
    append_le(buf, static_cast<std::uint32_t>(field.size()));
    buf.insert(buf.end(), field.begin(), field.end());
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string NormalizeText(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;

    std::string normalized;
    normalized.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
    }
    return normalized;
}

CacheKey DeriveCacheKey(const std::string& text,
                        const std::string& voice_id,
                        const std::string& format,
                        const std::string& engine) {
    const std::string normalized = NormalizeText(text);

    std::vector<std::uint8_t> serialization_buffer;
    serialization_buffer.reserve(1 + 4 * sizeof(std::uint32_t) + normalized.size() +
                                 voice_id.size() + format.size() + engine.size());

    serialization_buffer.push_back(kKeyVersion);
    append_field(serialization_buffer, normalized);
    append_field(serialization_buffer, voice_id);
    append_field(serialization_buffer, format);
    append_field(serialization_buffer, engine);

    XXH128_hash_t hash = XXH3_128bits(serialization_buffer.data(), serialization_buffer.size());

    // Canonical form is big-endian and independent of host byte order.
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, hash);

    CacheKey key;
    std::memcpy(key.data(), canonical.digest, key.size());
    return key;
}

std::string ToHex(const CacheKey& key) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : key) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

std::string DeriveCacheKeyHex(const std::string& text,
                              const std::string& voice_id,
                              const std::string& format,
                              const std::string& engine) {
    return ToHex(DeriveCacheKey(text, voice_id, format, engine));
}

} // namespace audiocache
