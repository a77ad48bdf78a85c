#include "env_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#ifdef _WIN32
  #include <windows.h>
#endif

static const char* const kKnownKeys[] = {
    "P2PKH_FILTER_DEFAULT_OUTPUT",
    "P2PKH_FILTER_PROGRESS_EVERY",
    "P2PKH_FILTER_DECODE",
    "P2PKH_FILTER_REPORT",
};

std::filesystem::path exe_dir() {
#ifdef _WIN32
    wchar_t buf[MAX_PATH];
    DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    return n ? std::filesystem::path(buf).parent_path()
             : std::filesystem::current_path();
#else
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) return self.parent_path();
    return std::filesystem::current_path();
#endif
}

static void trim_in_place(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::unordered_map<std::string, std::string> load_env(const std::filesystem::path& path) {
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    if (!in) return env;

    std::string line;
    while (std::getline(in, line)) {
        trim_in_place(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        trim_in_place(key);
        trim_in_place(val);
        if (!key.empty()) env[key] = val;
    }
    return env;
}

// 양의 정수만 허용
static bool parse_positive(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        const unsigned long long v = std::stoull(text);
        if (v == 0) return false;
        out = v;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

FilterConfig config_from_env(const std::unordered_map<std::string, std::string>& env,
                             std::ostream& diag) {
    FilterConfig cfg;

    if (auto it = env.find("P2PKH_FILTER_DEFAULT_OUTPUT"); it != env.end() && !it->second.empty())
        cfg.default_output = it->second;

    if (auto it = env.find("P2PKH_FILTER_PROGRESS_EVERY"); it != env.end()) {
        if (!parse_positive(it->second, cfg.options.progress_every)) {
            diag << "[warn] invalid P2PKH_FILTER_PROGRESS_EVERY '" << it->second
                 << "', using " << cfg.options.progress_every << "\n";
        }
    }

    if (auto it = env.find("P2PKH_FILTER_DECODE"); it != env.end()) {
        if (!parse_decode_mode(it->second, cfg.options.decode)) {
            diag << "[warn] invalid P2PKH_FILTER_DECODE '" << it->second
                 << "', using " << decode_mode_name(cfg.options.decode) << "\n";
        }
    }

    if (auto it = env.find("P2PKH_FILTER_REPORT"); it != env.end())
        cfg.report_path = it->second;

    return cfg;
}

FilterConfig load_filter_config(std::ostream& diag) {
    auto env = load_env(exe_dir() / ".env");

    // 환경변수가 .env 보다 우선
    for (const char* key : kKnownKeys) {
        if (const char* v = std::getenv(key)) env[key] = v;
    }
    return config_from_env(env, diag);
}
