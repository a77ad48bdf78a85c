#pragma once
#include <filesystem>

#include <nlohmann/json.hpp>

#include "functions/stream_filter/src/stream_filter.hpp"

// 실행 결과 요약 (JSON)
nlohmann::json run_report_json(const std::filesystem::path& input,
                               const std::filesystem::path& output,
                               const FilterOptions& options,
                               const RunSummary& summary);

// report_path에 저장. 실패 시 false (실행 결과에는 영향 없음)
bool write_run_report(const std::filesystem::path& report_path,
                      const std::filesystem::path& input,
                      const std::filesystem::path& output,
                      const FilterOptions& options,
                      const RunSummary& summary);
