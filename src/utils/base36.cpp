#include "base36.h"

namespace Base36 {

namespace {

const char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";

int digitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string encode(const Bytes& data) {
    std::size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) {
        ++zeros;
    }

    // Repeated long division of the big-endian number by 36.
    Bytes number(data.begin() + static_cast<std::ptrdiff_t>(zeros), data.end());
    std::string digits;
    while (!number.empty()) {
        Bytes quotient;
        quotient.reserve(number.size());
        unsigned int remainder = 0;
        for (unsigned char byte : number) {
            unsigned int accumulator = (remainder << 8) | byte;
            unsigned int q = accumulator / 36;
            remainder = accumulator % 36;
            if (!quotient.empty() || q != 0) {
                quotient.push_back(static_cast<unsigned char>(q));
            }
        }
        digits.push_back(ALPHABET[remainder]);
        number.swap(quotient);
    }

    std::string result(zeros, '0');
    result.append(digits.rbegin(), digits.rend());
    return result;
}

Bytes decode(const std::string& text) {
    std::size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '0') {
        ++zeros;
    }

    // Little-endian accumulator: value = value * 36 + digit.
    Bytes number;
    for (std::size_t i = zeros; i < text.size(); ++i) {
        int digit = digitValue(text[i]);
        if (digit < 0) {
            throw FormatError(std::string("invalid base36 character '") + text[i] + "'");
        }
        unsigned int carry = static_cast<unsigned int>(digit);
        for (unsigned char& byte : number) {
            unsigned int accumulator = static_cast<unsigned int>(byte) * 36 + carry;
            byte = static_cast<unsigned char>(accumulator & 0xff);
            carry = accumulator >> 8;
        }
        while (carry > 0) {
            number.push_back(static_cast<unsigned char>(carry & 0xff));
            carry >>= 8;
        }
    }

    Bytes result(zeros, 0);
    result.insert(result.end(), number.rbegin(), number.rend());
    return result;
}

std::string encodeMultibase(const Bytes& data) {
    return std::string(1, MULTIBASE_PREFIX) + encode(data);
}

Bytes decodeMultibase(const std::string& text) {
    if (text.empty()) {
        throw FormatError("empty multibase string");
    }
    if (text[0] != 'k' && text[0] != 'K') {
        throw FormatError(std::string("unsupported multibase prefix '") + text[0] + "'");
    }
    return decode(text.substr(1));
}

} // namespace Base36
