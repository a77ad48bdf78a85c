#pragma once
#include <filesystem>
#include <ostream>
#include <string>
#include <unordered_map>

#include "functions/stream_filter/src/stream_filter.hpp"

inline constexpr const char* kDefaultOutputName = "attack-addresses-p2pkh.txt";

struct FilterConfig {
    std::string   default_output = kDefaultOutputName;
    FilterOptions options;
    std::string   report_path;     // 비어 있으면 리포트 없음
};

// 실행 파일이 있는 디렉토리
std::filesystem::path exe_dir();

// .env 로드 (KEY=VALUE, # 주석). 파일이 없으면 빈 맵
std::unordered_map<std::string, std::string> load_env(const std::filesystem::path& path);

// 키/값 맵 -> 설정. 잘못된 값은 [warn] 후 기본값 유지
FilterConfig config_from_env(const std::unordered_map<std::string, std::string>& env,
                             std::ostream& diag);

// exe 옆 .env + 프로세스 환경변수(우선)
FilterConfig load_filter_config(std::ostream& diag);
