/**
 * @file LzStringEncoder.cpp
 * @brief Implementation of LzStringEncoder.
 */

#include "infrastructure/LzStringEncoder.hpp"

#include <algorithm>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace zlinker::infrastructure {

namespace {

constexpr const char* kBase64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=";
constexpr int kBitsPerChar = 6;
constexpr uint32_t kReplacementChar = 0xFFFD;

// Packs LSB-first values into 6-bit alphabet characters.
class BitWriter {
public:
    void write(int value, int numBits) {
        for (int i = 0; i < numBits; ++i) {
            m_value = (m_value << 1) | (value & 1);
            advance();
            value >>= 1;
        }
    }

    std::string finish() {
        while (true) {
            m_value <<= 1;
            if (m_position == kBitsPerChar - 1) {
                m_out.push_back(kBase64Alphabet[m_value]);
                break;
            }
            ++m_position;
        }
        return m_out;
    }

private:
    void advance() {
        if (m_position == kBitsPerChar - 1) {
            m_position = 0;
            m_out.push_back(kBase64Alphabet[m_value]);
            m_value = 0;
        } else {
            ++m_position;
        }
    }

    int m_value = 0;
    int m_position = 0;
    std::string m_out;
};

// Decodes one code point; advances i past it. Invalid sequences yield U+FFFD.
uint32_t NextCodePoint(const std::string& s, size_t& i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    int extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) { ++i; return c; }
    else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
    else { ++i; return kReplacementChar; }

    if (i + extra >= s.size()) {
        ++i;
        return kReplacementChar;
    }
    for (int k = 1; k <= extra; ++k) {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) {
            ++i;
            return kReplacementChar;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    i += extra + 1;
    return cp;
}

} // namespace

std::string LzStringEncoder::encode(const std::string& text) const {
    std::string compressed = CompressToBase64(EscapeNonAscii(text));
    std::string out;
    out.reserve(compressed.size());
    for (char c : compressed) {
        if (c == '+') out.push_back('-');
        else if (c == '/') out.push_back('_');
        else if (c != '=') out.push_back(c);
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string LzStringEncoder::EscapeNonAscii(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        uint32_t cp = NextCodePoint(utf8, i);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else {
            out += "&#" + std::to_string(cp) + ";";
        }
    }
    return out;
}

std::string LzStringEncoder::CompressToBase64(const std::string& ascii) {
    std::unordered_map<std::string, int> dictionary;
    std::unordered_set<std::string> toCreate;
    std::string w;
    int enlargeIn = 2;
    int dictSize = 3;
    int numBits = 2;
    BitWriter bits;

    auto consumeEnlarge = [&]() {
        if (--enlargeIn == 0) {
            enlargeIn = 1 << numBits;
            ++numBits;
        }
    };

    // Emits w, either as a new literal (8-bit, input is ASCII) or as a dictionary code.
    auto emit = [&]() {
        if (toCreate.count(w)) {
            bits.write(0, numBits);
            bits.write(static_cast<unsigned char>(w[0]), 8);
            consumeEnlarge();
            toCreate.erase(w);
        } else {
            bits.write(dictionary[w], numBits);
        }
        consumeEnlarge();
    };

    for (char ch : ascii) {
        std::string c(1, ch);
        if (!dictionary.count(c)) {
            dictionary[c] = dictSize++;
            toCreate.insert(c);
        }

        std::string wc = w + c;
        if (dictionary.count(wc)) {
            w = wc;
        } else {
            emit();
            dictionary[wc] = dictSize++;
            w = c;
        }
    }

    if (!w.empty()) {
        emit();
    }

    // End of stream marker.
    bits.write(2, numBits);

    std::string res = bits.finish();
    switch (res.size() % 4) {
        case 1: return res + "===";
        case 2: return res + "==";
        case 3: return res + "=";
        default: return res;
    }
}

} // namespace zlinker::infrastructure
