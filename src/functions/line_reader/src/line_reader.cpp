#include "line_reader.hpp"
#include "functions/filter_error/src/filter_error.hpp"

#include <algorithm>

const char* decode_mode_name(DecodeMode mode) {
    return mode == DecodeMode::Strict ? "strict" : "best-effort";
}

bool parse_decode_mode(std::string_view text, DecodeMode& out) {
    if (text == "best-effort") { out = DecodeMode::BestEffort; return true; }
    if (text == "strict")      { out = DecodeMode::Strict;     return true; }
    return false;
}

// ---- UTF-8 정리 ----
// 잘못된 시퀀스는 "최대 유효 접두부" 단위로 버리고, 문제 바이트부터 다시 검사
std::size_t drop_invalid_utf8(std::string& s) {
    // 대부분 ASCII (주소 목록)
    if (std::all_of(s.begin(), s.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; }))
        return 0;

    std::string out;
    out.reserve(s.size());
    std::size_t dropped = 0;
    const std::size_t n = s.size();
    std::size_t i = 0;

    while (i < n) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) { out.push_back(s[i]); ++i; continue; }

        // 선두 바이트별 후속 바이트 수 / 두 번째 바이트 허용 범위
        std::size_t need = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF)                      need = 1;
        else if (c == 0xE0)                              { need = 2; lo = 0xA0; }
        else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) need = 2;
        else if (c == 0xED)                              { need = 2; hi = 0x9F; }   // 서로게이트 제외
        else if (c == 0xF0)                              { need = 3; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3)                 need = 3;
        else if (c == 0xF4)                              { need = 3; hi = 0x8F; }
        else { ++dropped; ++i; continue; }               // 0x80~0xC1, 0xF5~0xFF

        std::size_t j = i + 1;
        std::size_t k = 0;
        while (k < need && j < n) {
            const auto cc = static_cast<unsigned char>(s[j]);
            const unsigned char l = (k == 0) ? lo : 0x80;
            const unsigned char h = (k == 0) ? hi : 0xBF;
            if (cc < l || cc > h) break;
            ++j; ++k;
        }
        if (k == need) out.append(s, i, j - i);
        else           dropped += j - i;
        i = j;
    }
    s.swap(out);
    return dropped;
}

// ---- LineReader ----
LineReader::LineReader(ByteSource& src, DecodeMode mode, std::size_t chunk_size)
    : src_(src), mode_(mode), buf_(chunk_size ? chunk_size : 1) {}

bool LineReader::fill() {
    if (eof_) return false;
    len_ = src_.read(buf_.data(), buf_.size());
    pos_ = 0;
    if (len_ == 0) {
        eof_ = true;
        return false;
    }
    return true;
}

bool LineReader::next(std::string& line) {
    line.clear();
    bool have_any = false;

    for (;;) {
        if (pos_ == len_ && !fill()) {
            if (!have_any) return false;
            break;                                        // 종결자 없는 마지막 줄
        }
        if (skip_lf_) {
            skip_lf_ = false;
            if (buf_[pos_] == '\n') { ++pos_; continue; } // \r\n 의 \n
        }

        const char* begin = buf_.data() + pos_;
        const char* end   = buf_.data() + len_;
        const char* hit   = std::find_if(begin, end, [](char c) { return c == '\n' || c == '\r'; });
        line.append(begin, hit);

        if (hit == end) {
            pos_ = len_;
            have_any = true;
            continue;
        }
        pos_ = static_cast<std::size_t>(hit - buf_.data()) + 1;
        if (*hit == '\r') skip_lf_ = true;
        break;
    }

    ++lines_read_;
    const std::size_t dropped = drop_invalid_utf8(line);
    if (dropped) {
        if (mode_ == DecodeMode::Strict) {
            throw FilterError(FilterErrorKind::Decode,
                              "Invalid UTF-8 at line " + std::to_string(lines_read_) +
                              " of '" + src_.describe() + "'.");
        }
        dropped_bytes_ += dropped;
    }
    return true;
}
