// =================================================================
// include/Zeke/InputHasher.hpp
// =================================================================
// FNV-1a 64-bit hashing of chat requests for cache keys.

#pragma once

#include "Zeke/ProviderTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Zeke {

/**
 * @brief Incremental FNV-1a 64 hasher
 *
 * Every field is prefixed with its length so that ("ab","c") and ("a","bc")
 * produce different digests.
 */
class InputHasher {
public:
    static constexpr uint64_t OFFSET_BASIS = 0xcbf29ce484222325ULL;
    static constexpr uint64_t PRIME = 0x100000001b3ULL;

    InputHasher& add(const std::string& field);
    InputHasher& add(double value);
    InputHasher& add(uint64_t value);

    uint64_t digest() const { return m_state; }

    /**
     * @brief Cache key of a chat request
     * @param model Model identifier
     * @param temperature Sampling temperature
     * @param top_p Nucleus sampling parameter
     * @param messages Ordered transcript
     */
    static uint64_t hashRequest(const std::string& model, double temperature, double top_p,
                                const std::vector<ChatMessage>& messages);

private:
    uint64_t m_state = OFFSET_BASIS;

    void mix(const unsigned char* data, size_t length);
};

} // namespace Zeke
