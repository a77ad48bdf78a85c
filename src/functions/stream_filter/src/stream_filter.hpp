#pragma once
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

#include "functions/line_reader/src/line_reader.hpp"

// 한 번의 실행 동안만 살아있는 카운터 (matched_count <= total_lines)
struct RunCounters {
    std::uint64_t total_lines = 0;
    std::uint64_t matched_count = 0;
};

struct FilterOptions {
    std::uint64_t progress_every = 1000000;   // 진행률 출력 간격 (줄)
    DecodeMode    decode = DecodeMode::BestEffort;
};

struct RunSummary {
    RunCounters   counters;
    std::uint64_t malformed_bytes_skipped = 0;
    double        elapsed_ms = 0.0;
};

// 1234567 -> "1,234,567"
std::string format_count(std::uint64_t n);

// 열린 reader/out 위에서 필터 루프만 수행.
// 진행률은 diag로, 매치된 줄(trim + '\n')은 out으로
RunCounters filter_stream(LineReader& reader, std::ostream& out, std::ostream& diag,
                          const FilterOptions& options);

// 입력/출력 파일을 열고 filter_stream 실행 후 요약 출력
// 오류 시 FilterError. 이미 쓴 출력은 그대로 남는다
RunSummary filter_addresses(const std::filesystem::path& input,
                            const std::filesystem::path& output,
                            std::ostream& diag,
                            const FilterOptions& options = {});
