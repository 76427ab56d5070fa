#include "core/encoding.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace lockbox::core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

bool isBase64UrlChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

bool isUnreserved(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string hexEncode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0f]);
    }
    return out;
}

std::string hexEncode(const std::vector<uint8_t>& data) {
    return hexEncode(data.data(), data.size());
}

std::string base64UrlEncode(const uint8_t* data, size_t len) {
    if (len == 0) {
        return {};
    }
    if (len > static_cast<size_t>(std::numeric_limits<int>::max() / 4)) {
        throw std::invalid_argument("Input too large for base64 encoding");
    }

    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::string base64UrlEncode(std::string_view data) {
    return base64UrlEncode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::optional<std::vector<uint8_t>> base64UrlDecode(std::string_view text) {
    while (!text.empty() && text.back() == '=') {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 == 1 ||
        text.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 2)) {
        return std::nullopt;
    }

    std::string padded;
    padded.reserve(text.size() + 3);
    for (char c : text) {
        if (!isBase64UrlChar(c)) {
            return std::nullopt;
        }
        padded.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
    }
    size_t padding = (4 - padded.size() % 4) % 4;
    padded.append(padding, '=');

    std::vector<uint8_t> out(padded.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts the '=' positions as zero bytes
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

std::string percentEncode(std::string_view text, bool keepSlash) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (isUnreserved(c) || (keepSlash && c == '/')) {
            out.push_back(c);
        } else {
            auto byte = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(static_cast<char>(std::toupper(HEX_DIGITS[byte >> 4])));
            out.push_back(static_cast<char>(std::toupper(HEX_DIGITS[byte & 0x0f])));
        }
    }
    return out;
}

std::optional<std::string> percentDecode(std::string_view text, bool formEncoded) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%') {
            if (i + 2 >= text.size()) {
                return std::nullopt;
            }
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (c == '+' && formEncoded) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string toLowerAscii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string trim(std::string_view text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

std::string canonicalEmail(std::string_view email) {
    return toLowerAscii(trim(email));
}

bool looksLikeEmail(std::string_view email) {
    if (email.empty() || email.size() > 255) {
        return false;
    }
    for (char c : email) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    size_t at = email.find('@');
    if (at == std::string_view::npos || at == 0 || email.find('@', at + 1) != std::string_view::npos) {
        return false;
    }
    std::string_view domain = email.substr(at + 1);
    size_t dot = domain.find('.');
    return !domain.empty() && dot != std::string_view::npos &&
           dot != 0 && dot != domain.size() - 1;
}

} // namespace lockbox::core
