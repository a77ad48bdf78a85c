#pragma once
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

// 필터 실행 중 발생하는 오류 분류
enum class FilterErrorKind {
    InputNotFound,
    PermissionDenied,
    Io,
    Decode,
};

// main에서 한 번만 잡아서 "Error: ..." 로 출력
class FilterError : public std::runtime_error {
public:
    FilterError(FilterErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    FilterErrorKind kind() const noexcept { return kind_; }

private:
    FilterErrorKind kind_;
};

// errno -> 사람이 읽는 설명 (0 이면 "unknown error")
inline std::string os_error_text(int err) {
    return err ? std::strerror(err) : "unknown error";
}

// 파일 열기 실패를 errno 기준으로 분류
// action: "read" / "write to"
inline FilterError open_error(const std::string& action, const std::string& path, int err) {
    if (err == EACCES || err == EPERM) {
        return FilterError(FilterErrorKind::PermissionDenied,
                           "Permission denied. Cannot " + action + " '" + path + "'.");
    }
    if (err == ENOENT && action == "read") {
        return FilterError(FilterErrorKind::InputNotFound,
                           "File '" + path + "' not found.");
    }
    return FilterError(FilterErrorKind::Io,
                       "OS error - cannot " + action + " '" + path + "': " + os_error_text(err));
}
