#pragma once
#include <cstdint>
#include <string>
#include <vector>

using BusAddress = uint16_t;
using RegisterWord = uint32_t;
using ByteBuffer = std::vector<uint8_t>;

// Native register word width on the bus (28-bit fixed point plus padding)
const size_t kRegisterWordBytes = 4;

struct RegisterSpan {
    BusAddress address = 0;
    uint32_t length = 0;    // bytes
};

struct RegisterWrite {
    BusAddress address = 0;
    RegisterWord word = 0;
};
