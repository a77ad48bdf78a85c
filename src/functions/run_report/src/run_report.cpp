#include "run_report.hpp"

#include <fstream>

nlohmann::json run_report_json(const std::filesystem::path& input,
                               const std::filesystem::path& output,
                               const FilterOptions& options,
                               const RunSummary& summary) {
    nlohmann::json j;
    j["input"]                   = input.string();
    j["output"]                  = output.string();
    j["total_lines"]             = summary.counters.total_lines;
    j["matched_count"]           = summary.counters.matched_count;
    j["malformed_bytes_skipped"] = summary.malformed_bytes_skipped;
    j["decode_mode"]             = decode_mode_name(options.decode);
    j["progress_every"]          = options.progress_every;
    j["elapsed_ms"]              = summary.elapsed_ms;
    return j;
}

bool write_run_report(const std::filesystem::path& report_path,
                      const std::filesystem::path& input,
                      const std::filesystem::path& output,
                      const FilterOptions& options,
                      const RunSummary& summary) {
    std::ofstream ofs(report_path, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs << run_report_json(input, output, options, summary).dump(2) << '\n';
    ofs.close();
    return static_cast<bool>(ofs);
}
