#pragma once
#include <cstddef>
#include <string_view>

// Base58 알파벳 (0, O, I, l 제외)
inline constexpr std::string_view kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// 주소 계열 하나의 구조적 규칙 (체크섬/디코딩 없음)
struct AddressFamily {
    std::string_view name;
    char             prefix;
    std::size_t      min_length;
    std::size_t      max_length;
    std::string_view alphabet;
};

// Legacy P2PKH: mainnet version byte 0x00 -> '1' 로 시작, 26~35자
inline constexpr AddressFamily kLegacyP2pkh{
    "p2pkh", '1', 26, 35, kBase58Alphabet
};

// 앞뒤 공백 제거 (ASCII + UTF-8 유니코드 공백)
std::string_view trim_whitespace(std::string_view s);

// trim 후 prefix -> 길이 -> 알파벳 순서로 검사. 예외 없음
bool matches_family(std::string_view line, const AddressFamily& family);

bool is_p2pkh_address(std::string_view line);
