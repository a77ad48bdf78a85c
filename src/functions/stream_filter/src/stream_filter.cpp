#include "stream_filter.hpp"
#include "functions/address_classifier/src/address_classifier.hpp"
#include "functions/byte_source/src/byte_source.hpp"
#include "functions/filter_error/src/filter_error.hpp"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

// 간단 타이머
struct StepTimer {
    std::chrono::steady_clock::time_point t0;
    StepTimer(): t0(std::chrono::steady_clock::now()) {}
    double elapsed_ms() const {
        using namespace std::chrono;
        return duration_cast<duration<double, std::milli>>(steady_clock::now() - t0).count();
    }
};

std::string format_count(std::uint64_t n) {
    std::string digits = std::to_string(n);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead) out.push_back(',');
        out.push_back(digits[i]);
    }
    return out;
}

RunCounters filter_stream(LineReader& reader, std::ostream& out, std::ostream& diag,
                          const FilterOptions& options) {
    RunCounters c;
    std::string line;
    line.reserve(128);

    while (reader.next(line)) {
        ++c.total_lines;

        // 현재 줄 판정 전에 출력 (stderr, 즉시 flush)
        if (options.progress_every && c.total_lines % options.progress_every == 0) {
            diag << "Processed " << format_count(c.total_lines) << " lines, found "
                 << format_count(c.matched_count) << " P2PKH addresses..." << std::endl;
        }

        if (!is_p2pkh_address(line)) continue;

        const std::string_view addr = trim_whitespace(line);
        errno = 0;
        out.write(addr.data(), static_cast<std::streamsize>(addr.size()));
        out.put('\n');
        if (!out) {
            const int err = errno;
            throw FilterError(FilterErrorKind::Io,
                              "OS error - write failed after " + format_count(c.matched_count) +
                              " address(es): " + os_error_text(err));
        }
        ++c.matched_count;
    }
    return c;
}

RunSummary filter_addresses(const fs::path& input, const fs::path& output,
                            std::ostream& diag, const FilterOptions& options) {
    StepTimer timer;
    const std::string in_str = input.string();
    const std::string out_str = output.string();

    // 시작 전에 확인 (출력 파일은 건드리지 않음)
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        throw FilterError(FilterErrorKind::InputNotFound,
                          "Input file '" + in_str + "' does not exist.");
    }
    if (fs::is_directory(input, ec)) {
        throw FilterError(FilterErrorKind::Io, "OS error - '" + in_str + "' is a directory");
    }

    diag << "Filtering P2PKH addresses from '" << in_str << "'...\n";
    diag << "Output will be saved to '" << out_str << "'...\n\n";

    // 입력 먼저 열기 -> 실패하면 출력 파일은 만들지 않음
    std::unique_ptr<ByteSource> src = open_byte_source(input);
    if (auto* zip = dynamic_cast<ZipEntrySource*>(src.get())) {
        diag << "[info] reading zip entry '" << zip->entry_name() << "'\n";
        if (zip->file_entries() > 1) {
            diag << "[warn] archive has " << zip->file_entries()
                 << " file entries, only the first is filtered\n";
        }
    }

    errno = 0;
    std::ofstream ofs(output, std::ios::binary | std::ios::trunc);
    if (!ofs) throw open_error("write to", out_str, errno);

    LineReader reader(*src, options.decode);

    RunSummary summary;
    summary.counters = filter_stream(reader, ofs, diag, options);

    // 버퍼에 남은 내용은 close 에서 기록됨 (디스크 부족은 여기서 드러남)
    errno = 0;
    ofs.close();
    if (!ofs) {
        const int err = errno;
        throw FilterError(FilterErrorKind::Io,
                          "OS error - failed to flush '" + out_str + "': " + os_error_text(err));
    }
    summary.malformed_bytes_skipped = reader.dropped_bytes();
    summary.elapsed_ms = timer.elapsed_ms();

    diag << "\n✓ Filtering complete!\n";
    diag << "  Total lines processed: " << format_count(summary.counters.total_lines) << "\n";
    diag << "  P2PKH addresses found: " << format_count(summary.counters.matched_count) << "\n";
    diag << "  Output saved to: " << out_str << "\n";
    if (summary.malformed_bytes_skipped) {
        diag << "[warn] skipped " << format_count(summary.malformed_bytes_skipped)
             << " malformed byte(s) while decoding\n";
    }
    // 호출자 스트림의 포맷 상태는 건드리지 않음
    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(1) << summary.elapsed_ms;
    diag << "  (elapsed: " << elapsed.str() << " ms)" << std::endl;

    return summary;
}
