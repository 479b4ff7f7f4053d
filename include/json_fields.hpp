#pragma once
#include <ArduinoJson.h>
#include <stdint.h>
#include <stdlib.h>
#include <string>

// Accepts a non-negative integer or a numeric string ("32", "0x0020").
inline bool jsonToUnsigned(JsonVariantConst value, uint32_t& out) {
    // Negative integers and ones too wide for JsonUInteger fail this check
    if (value.is<JsonUInteger>()) {
        JsonUInteger v = value.as<JsonUInteger>();
        if ((uint64_t)v > 0xFFFFFFFFull) return false;
        out = (uint32_t)v;
        return true;
    }
    if (value.is<const char*>()) {
        const char* s = value.as<const char*>();
        if (!s || !*s || *s == '-') return false;
        char* end = nullptr;
        unsigned long long v = strtoull(s, &end, 0);
        if (*end != '\0' || v > 0xFFFFFFFFull) return false;
        out = (uint32_t)v;
        return true;
    }
    return false;
}

// Pool size that always fits 'json' once parsed: a slot per value (at most
// one more than the commas and opening brackets) plus a copy of every string.
inline size_t jsonCapacityFor(const std::string& json) {
    size_t values = 1;
    for (char c : json) {
        if (c == ',' || c == '[' || c == '{') values++;
    }
    return JSON_ARRAY_SIZE(values) + json.size() + 1;
}
