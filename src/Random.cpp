#include "airlink/Random.hpp"
#include "airlink/Types.hpp"
#include <sodium.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <iostream>

namespace airlink {

bool Random::initialize() {
    if (sodium_init() < 0) {
        std::cerr << "ERROR: Failed to initialize libsodium" << std::endl;
        return false;
    }

    return true;
}

bool Random::randomBytes(std::vector<uint8_t>& buffer) {
    if (buffer.empty()) {
        return true;
    }

    return randomBytes(buffer.data(), buffer.size());
}

bool Random::randomBytes(uint8_t* buffer, size_t size) {
    if (buffer == nullptr) {
        std::cerr << "Error: Null buffer provided to randomBytes" << std::endl;
        return false;
    }

    if (size == 0) {
        return true;
    }

    // sodium_init is idempotent and thread safe
    if (sodium_init() < 0) {
        std::cerr << "Error: libsodium not initialized in randomBytes" << std::endl;
        return false;
    }

    randombytes_buf(buffer, size);
    return true;
}

uint64_t Random::randomU64() {
    uint64_t value = 0;
    if (!randomBytes(reinterpret_cast<uint8_t*>(&value), sizeof(value))) {
        throw std::runtime_error("Random generator unavailable");
    }
    return value;
}

std::string Random::hexEncode(const std::vector<uint8_t>& data) {
    std::stringstream hexStream;
    hexStream << std::hex << std::setfill('0');

    for (uint8_t byte : data) {
        hexStream << std::setw(2) << static_cast<int>(byte);
    }

    return hexStream.str();
}

std::string Random::transferId() {
    std::vector<uint8_t> bytes(TRANSFER_ID_BYTES);
    if (!randomBytes(bytes)) {
        throw std::runtime_error("Random generator unavailable");
    }
    return hexEncode(bytes);
}

std::string Random::peerId() {
    std::vector<uint8_t> bytes(PEER_ID_BYTES);
    if (!randomBytes(bytes)) {
        throw std::runtime_error("Random generator unavailable");
    }
    return hexEncode(bytes);
}

uint64_t Random::nonce() {
    return randomU64();
}

} // namespace airlink
