#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace audiocache {

// 128-bit content address of one synthesis request.
using CacheKey = std::array<std::uint8_t, 16>;

// Trims ASCII whitespace and lowercases.
std::string NormalizeText(const std::string& text);

// Stable across processes: no salt, fixed serialization version.
CacheKey DeriveCacheKey(const std::string& text,
                        const std::string& voice_id,
                        const std::string& format,
                        const std::string& engine);

std::string ToHex(const CacheKey& key);

// Hex form of DeriveCacheKey; this is the key string every tier stores under.
std::string DeriveCacheKeyHex(const std::string& text,
                              const std::string& voice_id,
                              const std::string& format,
                              const std::string& engine);

} // namespace audiocache
