#include "address_classifier.hpp"

// ---- 공백 판정 ----
// ASCII: \t \n \v \f \r, 0x1C~0x1F, ' '
static bool is_ascii_space(unsigned char c) {
    return (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x20);
}

// UTF-8로 인코딩된 유니코드 공백 (2/3 바이트)
static bool is_unicode_space2(unsigned char b0, unsigned char b1) {
    return b0 == 0xC2 && (b1 == 0x85 || b1 == 0xA0);                 // U+0085, U+00A0
}

static bool is_unicode_space3(unsigned char b0, unsigned char b1, unsigned char b2) {
    if (b0 == 0xE1) return b1 == 0x9A && b2 == 0x80;                  // U+1680
    if (b0 == 0xE3) return b1 == 0x80 && b2 == 0x80;                  // U+3000
    if (b0 != 0xE2) return false;
    if (b1 == 0x80) {
        return (b2 >= 0x80 && b2 <= 0x8A)                             // U+2000~200A
            || b2 == 0xA8 || b2 == 0xA9                               // U+2028, U+2029
            || b2 == 0xAF;                                            // U+202F
    }
    return b1 == 0x81 && b2 == 0x9F;                                  // U+205F
}

// 앞쪽 공백 한 글자의 바이트 수 (공백 아니면 0)
static std::size_t leading_space_len(std::string_view s) {
    if (s.empty()) return 0;
    const auto c0 = static_cast<unsigned char>(s[0]);
    if (is_ascii_space(c0)) return 1;
    if (s.size() >= 2 && is_unicode_space2(c0, static_cast<unsigned char>(s[1]))) return 2;
    if (s.size() >= 3 && is_unicode_space3(c0, static_cast<unsigned char>(s[1]),
                                           static_cast<unsigned char>(s[2]))) return 3;
    return 0;
}

static std::size_t trailing_space_len(std::string_view s) {
    const std::size_t n = s.size();
    if (n == 0) return 0;
    if (is_ascii_space(static_cast<unsigned char>(s[n-1]))) return 1;
    if (n >= 2 && is_unicode_space2(static_cast<unsigned char>(s[n-2]),
                                    static_cast<unsigned char>(s[n-1]))) return 2;
    if (n >= 3 && is_unicode_space3(static_cast<unsigned char>(s[n-3]),
                                    static_cast<unsigned char>(s[n-2]),
                                    static_cast<unsigned char>(s[n-1]))) return 3;
    return 0;
}

std::string_view trim_whitespace(std::string_view s) {
    while (std::size_t k = leading_space_len(s)) s.remove_prefix(k);
    while (std::size_t k = trailing_space_len(s)) s.remove_suffix(k);
    return s;
}

bool matches_family(std::string_view line, const AddressFamily& family) {
    const std::string_view addr = trim_whitespace(line);
    if (addr.empty()) return false;

    // (1) prefix
    if (addr.front() != family.prefix) return false;

    // (2) 길이 (양 끝 포함)
    if (addr.size() < family.min_length || addr.size() > family.max_length) return false;

    // (3) 알파벳
    for (char c : addr) {
        if (family.alphabet.find(c) == std::string_view::npos) return false;
    }
    return true;
}

bool is_p2pkh_address(std::string_view line) {
    return matches_family(line, kLegacyP2pkh);
}
