#include "byte_source.hpp"
#include "functions/filter_error/src/filter_error.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>

// ---- 일반 파일 ----
FileByteSource::FileByteSource(const std::filesystem::path& path)
    : path_(path) {
    errno = 0;
    in_.open(path_, std::ios::binary);
    if (!in_) throw open_error("read", path_.string(), errno);
}

std::size_t FileByteSource::read(char* buf, std::size_t n) {
    if (in_.eof()) return 0;
    in_.read(buf, static_cast<std::streamsize>(n));
    if (in_.bad()) {
        throw FilterError(FilterErrorKind::Io,
                          "OS error - read failed on '" + path_.string() + "'");
    }
    return static_cast<std::size_t>(in_.gcount());
}

std::string FileByteSource::describe() const {
    return path_.string();
}

// ---- zip 엔트리 ----
ZipEntrySource::ZipEntrySource(const std::filesystem::path& path)
    : path_(path) {
    const std::string p = path_.string();

    // 권한/존재 여부는 일반 파일과 같은 방식으로 먼저 판정
    {
        errno = 0;
        std::ifstream readable(path_, std::ios::binary);
        if (!readable) throw open_error("read", p, errno);
    }

    int errcode = 0;
    archive_ = zip_open(p.c_str(), ZIP_RDONLY, &errcode);
    if (!archive_) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        std::string msg = "OS error - zip_open failed on '" + p + "': " + zip_error_strerror(&ze);
        zip_error_fini(&ze);
        throw FilterError(FilterErrorKind::Io, msg);
    }

    try {
        const zip_int64_t n = zip_get_num_entries(archive_, 0);
        zip_int64_t first = -1;
        for (zip_int64_t i = 0; i < n; ++i) {
            zip_stat_t st;
            zip_stat_init(&st);
            if (zip_stat_index(archive_, static_cast<zip_uint64_t>(i), 0, &st) != 0) continue;
            if (!(st.valid & ZIP_STAT_NAME)) continue;
            std::string name = st.name;
            if (!name.empty() && name.back() == '/') continue;   // 디렉토리
            if (first < 0) {
                first = i;
                entry_name_ = name;
            }
            ++file_entries_;
        }
        if (first < 0)
            throw FilterError(FilterErrorKind::Io, "OS error - no file entry in archive '" + p + "'");

        file_ = zip_fopen_index(archive_, static_cast<zip_uint64_t>(first), 0);
        if (!file_) {
            throw FilterError(FilterErrorKind::Io,
                              "OS error - zip_fopen failed: " + entry_name_ + " (" + zip_strerror(archive_) + ")");
        }
    }
    catch (...) {
        zip_close(archive_);
        throw;
    }
}

ZipEntrySource::~ZipEntrySource() {
    if (file_) zip_fclose(file_);
    if (archive_) zip_close(archive_);
}

std::size_t ZipEntrySource::read(char* buf, std::size_t n) {
    const zip_int64_t got = zip_fread(file_, buf, n);
    if (got < 0) {
        throw FilterError(FilterErrorKind::Io,
                          "OS error - zip_fread failed: " + entry_name_ + " (" + zip_file_strerror(file_) + ")");
    }
    return static_cast<std::size_t>(got);
}

std::string ZipEntrySource::describe() const {
    return path_.string() + ":" + entry_name_;
}

bool is_zip_path(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".zip";
}

std::unique_ptr<ByteSource> open_byte_source(const std::filesystem::path& path) {
    if (is_zip_path(path)) return std::make_unique<ZipEntrySource>(path);
    return std::make_unique<FileByteSource>(path);
}
