#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "types.hpp"

enum class EncodingKind {
    FIXED_POINT,    // signed Qi.f, e.g. Q5.23 in a 28-bit field
    RAW_INTEGER,
    BIT_FLAG
};

// Per-parameter register encoding. Only the fields of the active kind are meaningful.
struct ParameterEncoding {
    EncodingKind kind = EncodingKind::FIXED_POINT;
    uint8_t integer_bits = 5;
    uint8_t fractional_bits = 23;
    uint8_t bits = 32;          // RAW_INTEGER width
    bool is_signed = true;      // RAW_INTEGER signedness
    uint8_t bit = 0;            // BIT_FLAG position

    static ParameterEncoding fixedPoint(uint8_t integer_bits, uint8_t fractional_bits);
    static ParameterEncoding rawInteger(uint8_t bits, bool is_signed);
    static ParameterEncoding bitFlag(uint8_t bit);

    // Register words occupied by one value
    size_t wordsPerValue() const { return 1; }
    std::string describe() const;
};

// Result of encoding one host value. 'clamped' is the RangeClamped
// condition: the value was saturated but the write still goes ahead.
struct EncodedWord {
    RegisterWord word = 0;
    bool clamped = false;
};

// Throws InvalidRequestError for NaN or an encoding whose widths are out of range.
EncodedWord encodeValue(double value, const ParameterEncoding& encoding);
double decodeWord(RegisterWord word, const ParameterEncoding& encoding);

// Smallest and largest host values the encoding can represent.
double encodingMinimum(const ParameterEncoding& encoding);
double encodingMaximum(const ParameterEncoding& encoding);

// Big-endian word packing, as the chip expects on the wire.
ByteBuffer packWords(const std::vector<RegisterWord>& words);
std::vector<RegisterWord> unpackWords(const ByteBuffer& bytes);

double dbToLinear(double db);
double linearToDb(double linear);
