#include "../include/fixed_point_codec.hpp"
#include "../include/exceptions.hpp"
#include <cmath>

ParameterEncoding ParameterEncoding::fixedPoint(uint8_t integer_bits, uint8_t fractional_bits) {
    ParameterEncoding enc;
    enc.kind = EncodingKind::FIXED_POINT;
    enc.integer_bits = integer_bits;
    enc.fractional_bits = fractional_bits;
    return enc;
}

ParameterEncoding ParameterEncoding::rawInteger(uint8_t bits, bool is_signed) {
    ParameterEncoding enc;
    enc.kind = EncodingKind::RAW_INTEGER;
    enc.bits = bits;
    enc.is_signed = is_signed;
    return enc;
}

ParameterEncoding ParameterEncoding::bitFlag(uint8_t bit) {
    ParameterEncoding enc;
    enc.kind = EncodingKind::BIT_FLAG;
    enc.bit = bit;
    return enc;
}

std::string ParameterEncoding::describe() const {
    switch (kind) {
        case EncodingKind::FIXED_POINT:
            return "Q" + std::to_string(integer_bits) + "." + std::to_string(fractional_bits);
        case EncodingKind::RAW_INTEGER:
            return std::string(is_signed ? "int" : "uint") + std::to_string(bits);
        case EncodingKind::BIT_FLAG:
            return "bit" + std::to_string(bit);
        default:
            return "unknown";
    }
}

namespace {

// Width of the two's-complement (or unsigned) field and its scale
struct FieldShape {
    int width;
    int fraction;
    bool is_signed;
};

FieldShape fieldShape(const ParameterEncoding& enc) {
    FieldShape shape;
    if (enc.kind == EncodingKind::FIXED_POINT) {
        int total = (int)enc.integer_bits + (int)enc.fractional_bits;
        if (enc.integer_bits < 1 || total > 32) {
            throw InvalidRequestError("unsupported fixed-point format " + enc.describe());
        }
        shape.width = total;
        shape.fraction = enc.fractional_bits;
        shape.is_signed = true;
    } else {
        if (enc.bits < 1 || enc.bits > 32) {
            throw InvalidRequestError("unsupported integer width " + std::to_string(enc.bits));
        }
        shape.width = enc.bits;
        shape.fraction = 0;
        shape.is_signed = enc.is_signed;
    }
    return shape;
}

double fieldMinimum(const FieldShape& shape) {
    return shape.is_signed ? -std::ldexp(1.0, shape.width - 1) : 0.0;
}

double fieldMaximum(const FieldShape& shape) {
    return shape.is_signed ? std::ldexp(1.0, shape.width - 1) - 1.0 : std::ldexp(1.0, shape.width) - 1.0;
}

} // namespace

EncodedWord encodeValue(double value, const ParameterEncoding& encoding) {
    if (std::isnan(value)) {
        throw InvalidRequestError("cannot encode NaN");
    }
    EncodedWord out;

    if (encoding.kind == EncodingKind::BIT_FLAG) {
        if (encoding.bit > 31) {
            throw InvalidRequestError("flag bit " + std::to_string(encoding.bit) + " is outside the register word");
        }
        out.clamped = !(value == 0.0 || value == 1.0);
        out.word = value != 0.0 ? (RegisterWord)(1u << encoding.bit) : 0;
        return out;
    }

    FieldShape shape = fieldShape(encoding);
    // std::round breaks ties away from zero
    double steps = std::round(value * std::ldexp(1.0, shape.fraction));
    double lo = fieldMinimum(shape);
    double hi = fieldMaximum(shape);
    if (steps < lo) {
        steps = lo;
        out.clamped = true;
    } else if (steps > hi) {
        steps = hi;
        out.clamped = true;
    }
    // Negative values come out sign-extended over the full 32-bit word
    int64_t raw = (int64_t)steps;
    out.word = (RegisterWord)(uint32_t)raw;
    return out;
}

double decodeWord(RegisterWord word, const ParameterEncoding& encoding) {
    if (encoding.kind == EncodingKind::BIT_FLAG) {
        if (encoding.bit > 31) {
            throw InvalidRequestError("flag bit " + std::to_string(encoding.bit) + " is outside the register word");
        }
        return (word >> encoding.bit) & 1u ? 1.0 : 0.0;
    }

    FieldShape shape = fieldShape(encoding);
    uint32_t mask = shape.width == 32 ? 0xFFFFFFFFu : ((1u << shape.width) - 1u);
    int64_t raw = (int64_t)(word & mask);
    if (shape.is_signed && (raw & ((int64_t)1 << (shape.width - 1)))) {
        raw -= (int64_t)1 << shape.width;
    }
    return std::ldexp((double)raw, -shape.fraction);
}

double encodingMinimum(const ParameterEncoding& encoding) {
    if (encoding.kind == EncodingKind::BIT_FLAG) return 0.0;
    FieldShape shape = fieldShape(encoding);
    return std::ldexp(fieldMinimum(shape), -shape.fraction);
}

double encodingMaximum(const ParameterEncoding& encoding) {
    if (encoding.kind == EncodingKind::BIT_FLAG) return 1.0;
    FieldShape shape = fieldShape(encoding);
    return std::ldexp(fieldMaximum(shape), -shape.fraction);
}

ByteBuffer packWords(const std::vector<RegisterWord>& words) {
    ByteBuffer bytes;
    bytes.reserve(words.size() * kRegisterWordBytes);
    for (RegisterWord w : words) {
        bytes.push_back((uint8_t)((w >> 24) & 0xFF));
        bytes.push_back((uint8_t)((w >> 16) & 0xFF));
        bytes.push_back((uint8_t)((w >> 8) & 0xFF));
        bytes.push_back((uint8_t)(w & 0xFF));
    }
    return bytes;
}

std::vector<RegisterWord> unpackWords(const ByteBuffer& bytes) {
    if (bytes.size() % kRegisterWordBytes != 0) {
        throw InvalidRequestError("payload of " + std::to_string(bytes.size()) +
                                  " bytes is not a whole number of register words");
    }
    std::vector<RegisterWord> words;
    words.reserve(bytes.size() / kRegisterWordBytes);
    for (size_t i = 0; i < bytes.size(); i += kRegisterWordBytes) {
        words.push_back(((RegisterWord)bytes[i] << 24) | ((RegisterWord)bytes[i + 1] << 16) |
                        ((RegisterWord)bytes[i + 2] << 8) | (RegisterWord)bytes[i + 3]);
    }
    return words;
}

double dbToLinear(double db) {
    return std::pow(10.0, db / 20.0);
}

double linearToDb(double linear) {
    return 20.0 * std::log10(linear);
}
