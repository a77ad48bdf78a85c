#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "functions/byte_source/src/byte_source.hpp"

// 잘못된 UTF-8 바이트 처리 방식
enum class DecodeMode {
    BestEffort,  // 잘못된 바이트는 버리고 계속 진행
    Strict,      // 첫 잘못된 바이트에서 FilterError(Decode)
};

const char* decode_mode_name(DecodeMode mode);

// "best-effort" / "strict" 파싱. 실패 시 false
bool parse_decode_mode(std::string_view text, DecodeMode& out);

// 유효하지 않은 UTF-8 바이트 제거. 반환: 제거한 바이트 수
std::size_t drop_invalid_utf8(std::string& s);

// ByteSource에서 한 줄씩 읽는다.
// \n, \r\n, \r 모두 줄 끝으로 처리 (버퍼 경계에 걸친 \r\n 포함)
class LineReader {
public:
    explicit LineReader(ByteSource& src,
                        DecodeMode mode = DecodeMode::BestEffort,
                        std::size_t chunk_size = 64 * 1024);

    // 다음 줄을 line에 채운다 (종결자 제외). EOF면 false
    bool next(std::string& line);

    std::uint64_t lines_read() const { return lines_read_; }
    std::uint64_t dropped_bytes() const { return dropped_bytes_; }
    DecodeMode mode() const { return mode_; }

private:
    bool fill();

    ByteSource&       src_;
    DecodeMode        mode_;
    std::vector<char> buf_;
    std::size_t       pos_ = 0;
    std::size_t       len_ = 0;
    bool              eof_ = false;
    bool              skip_lf_ = false;   // 직전 줄이 \r 로 끝남
    std::uint64_t     lines_read_ = 0;
    std::uint64_t     dropped_bytes_ = 0;
};
