#include "functions/run_report/src/run_report.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

namespace {

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

RunSummary sample_summary() {
  RunSummary s;
  s.counters.total_lines = 27000000;
  s.counters.matched_count = 19000000;
  s.malformed_bytes_skipped = 4;
  s.elapsed_ms = 1234.5;
  return s;
}

void test_json_fields() {
  FilterOptions opt;
  opt.decode = DecodeMode::Strict;
  opt.progress_every = 500;
  const nlohmann::json j = run_report_json("in.txt", "out.txt", opt, sample_summary());

  check(j.at("input") == "in.txt", "input");
  check(j.at("output") == "out.txt", "output");
  check(j.at("total_lines").get<std::uint64_t>() == 27000000, "total_lines");
  check(j.at("matched_count").get<std::uint64_t>() == 19000000, "matched_count");
  check(j.at("malformed_bytes_skipped").get<std::uint64_t>() == 4, "malformed_bytes_skipped");
  check(j.at("decode_mode") == "strict", "decode_mode");
  check(j.at("progress_every").get<std::uint64_t>() == 500, "progress_every");
  check(j.at("elapsed_ms").get<double>() == 1234.5, "elapsed_ms");
}

void test_write_and_read_back() {
  std::random_device rd;
  const fs::path dir = fs::temp_directory_path() / ("p2pkh_report_" + std::to_string(rd()));
  fs::create_directories(dir);
  const fs::path report = dir / "report.json";

  check(write_run_report(report, "in.txt", "out.txt", FilterOptions{}, sample_summary()), "report written");
  std::ifstream ifs(report);
  const nlohmann::json j = nlohmann::json::parse(ifs);
  check(j.at("matched_count").get<std::uint64_t>() == 19000000, "report round trip");
  check(j.at("decode_mode") == "best-effort", "default decode mode in report");

  check(!write_run_report(dir / "missing" / "report.json", "in.txt", "out.txt", FilterOptions{}, sample_summary()),
        "unwritable report path returns false");
  fs::remove_all(dir);
}

} // namespace

int main() {
  test_json_fields();
  test_write_and_read_back();
  std::cout << "run report tests passed\n";
  return 0;
}
