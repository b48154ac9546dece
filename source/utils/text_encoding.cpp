#include "utils/text_encoding.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace text_encoding {

namespace {

int hex_value(char character) {
    if (character >= '0' && character <= '9') {
        return character - '0';
    }
    if (character >= 'a' && character <= 'f') {
        return 10 + (character - 'a');
    }
    if (character >= 'A' && character <= 'F') {
        return 10 + (character - 'A');
    }
    return -1;
}

bool is_unreserved(unsigned char character) {
    return std::isalnum(character) || character == '-' || character == '.' ||
           character == '_' || character == '~';
}

// Length of the sequence introduced by lead, or 0 if lead cannot start one.
std::size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80u) {
        return 1;
    }
    if (lead >= 0xC2u && lead <= 0xDFu) {
        return 2;
    }
    if (lead >= 0xE0u && lead <= 0xEFu) {
        return 3;
    }
    if (lead >= 0xF0u && lead <= 0xF4u) {
        return 4;
    }
    return 0;
}

// Second-byte ranges that exclude overlong forms, surrogates and > U+10FFFF.
bool second_byte_allowed(unsigned char lead, unsigned char second) {
    switch (lead) {
    case 0xE0u:
        return second >= 0xA0u && second <= 0xBFu;
    case 0xEDu:
        return second >= 0x80u && second <= 0x9Fu;
    case 0xF0u:
        return second >= 0x90u && second <= 0xBFu;
    case 0xF4u:
        return second >= 0x80u && second <= 0x8Fu;
    default:
        return (second & 0xC0u) == 0x80u;
    }
}

} // namespace

bool hex_to_bytes(const std::string &hex, std::string &out_bytes) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out_bytes.clear();
    out_bytes.reserve(hex.size() / 2);
    for (std::size_t index = 0; index < hex.size(); index += 2) {
        int high = hex_value(hex[index]);
        int low = hex_value(hex[index + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        out_bytes.push_back(static_cast<char>((high << 4) | low));
    }
    return true;
}

std::string bytes_to_hex(const std::string &bytes) {
    static const char *HEX_DIGITS = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char byte : bytes) {
        hex.push_back(HEX_DIGITS[byte >> 4]);
        hex.push_back(HEX_DIGITS[byte & 0x0f]);
    }
    return hex;
}

std::string base64url_encode(const std::string &bytes) {
    if (bytes.empty()) {
        return "";
    }
    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL.
    std::vector<unsigned char> encoded(4 * ((bytes.size() + 2) / 3) + 1);
    int encoded_length = EVP_EncodeBlock(encoded.data(),
                                         reinterpret_cast<const unsigned char *>(bytes.data()),
                                         static_cast<int>(bytes.size()));
    std::string result(reinterpret_cast<const char *>(encoded.data()),
                       static_cast<std::size_t>(encoded_length));

    for (char &character : result) {
        if (character == '+') {
            character = '-';
        } else if (character == '/') {
            character = '_';
        }
    }
    while (!result.empty() && result.back() == '=') {
        result.pop_back();
    }
    return result;
}

std::string percent_encode(const std::string &text, const std::string &keep_literal) {
    static const char kHexDigits[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(text.size());
    for (char raw_character : text) {
        unsigned char character = static_cast<unsigned char>(raw_character);
        if (is_unreserved(character) || keep_literal.find(raw_character) != std::string::npos) {
            result += raw_character;
            continue;
        }
        result += '%';
        result += kHexDigits[character >> 4];
        result += kHexDigits[character & 0x0F];
    }
    return result;
}

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

std::string to_upper(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return result;
}

std::string trim(const std::string &input) {
    std::size_t begin = 0;
    while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin]))) {
        ++begin;
    }
    std::size_t end = input.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return input.substr(begin, end - begin);
}

std::string sanitize_utf8(const std::string &text) {
    static const std::string kReplacement = "\xEF\xBF\xBD";
    std::string result;
    result.reserve(text.size());

    std::size_t index = 0;
    while (index < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[index]);
        std::size_t length = utf8_sequence_length(lead);
        bool valid = length != 0 && index + length <= text.size();
        if (valid && length > 1) {
            valid = second_byte_allowed(lead, static_cast<unsigned char>(text[index + 1]));
            for (std::size_t offset = 2; valid && offset < length; ++offset) {
                valid = (static_cast<unsigned char>(text[index + offset]) & 0xC0u) == 0x80u;
            }
        }
        if (!valid) {
            result += kReplacement;
            ++index;
            continue;
        }
        result.append(text, index, length);
        index += length;
    }
    return result;
}

std::string truncate_utf8(const std::string &text, std::size_t max_code_points) {
    std::size_t code_points = 0;
    for (std::size_t index = 0; index < text.size(); ++index) {
        unsigned char byte = static_cast<unsigned char>(text[index]);
        // Continuation bytes belong to the code point already counted.
        if ((byte & 0xC0u) == 0x80u) {
            continue;
        }
        if (code_points == max_code_points) {
            return text.substr(0, index);
        }
        ++code_points;
    }
    return text;
}

} // namespace text_encoding
