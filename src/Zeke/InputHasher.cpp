// =================================================================
// src/Zeke/InputHasher.cpp
// =================================================================

#include "Zeke/InputHasher.hpp"
#include <cstring>

namespace Zeke {

void InputHasher::mix(const unsigned char* data, size_t length) {
    for (size_t i = 0; i < length; ++i) {
        m_state ^= data[i];
        m_state *= PRIME;
    }
}

InputHasher& InputHasher::add(uint64_t value) {
    unsigned char bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>((value >> (8 * i)) & 0xff);
    }
    mix(bytes, sizeof(bytes));
    return *this;
}

InputHasher& InputHasher::add(const std::string& field) {
    add(static_cast<uint64_t>(field.size()));
    mix(reinterpret_cast<const unsigned char*>(field.data()), field.size());
    return *this;
}

InputHasher& InputHasher::add(double value) {
    uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    return add(bits);
}

uint64_t InputHasher::hashRequest(const std::string& model, double temperature, double top_p,
                                  const std::vector<ChatMessage>& messages) {
    InputHasher hasher;
    hasher.add(model).add(temperature).add(top_p);
    hasher.add(static_cast<uint64_t>(messages.size()));
    for (const auto& message : messages) {
        hasher.add(message.role).add(message.content);
    }
    return hasher.digest();
}

} // namespace Zeke
