#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <zip.h>

// 입력 바이트 스트림 (순차 읽기 전용)
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // 최대 n 바이트를 buf에 채운다. 0 = EOF. 오류 시 FilterError(Io)
    virtual std::size_t read(char* buf, std::size_t n) = 0;

    // 로그용 설명
    virtual std::string describe() const = 0;
};

// 일반 텍스트 파일
class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(const std::filesystem::path& path);

    std::size_t read(char* buf, std::size_t n) override;
    std::string describe() const override;

private:
    std::filesystem::path path_;
    std::ifstream         in_;
};

// zip 아카이브 안의 첫 번째 파일 엔트리 (압축 해제하면서 스트리밍)
class ZipEntrySource : public ByteSource {
public:
    explicit ZipEntrySource(const std::filesystem::path& path);
    ~ZipEntrySource() override;

    ZipEntrySource(const ZipEntrySource&) = delete;
    ZipEntrySource& operator=(const ZipEntrySource&) = delete;

    std::size_t read(char* buf, std::size_t n) override;
    std::string describe() const override;

    const std::string& entry_name() const { return entry_name_; }
    std::uint64_t file_entries() const { return file_entries_; }

private:
    std::filesystem::path path_;
    zip_t*                archive_ = nullptr;
    zip_file_t*           file_ = nullptr;
    std::string           entry_name_;
    std::uint64_t         file_entries_ = 0;
};

// 확장자 .zip 여부 (대소문자 무시)
bool is_zip_path(const std::filesystem::path& path);

// 경로에 맞는 소스를 연다
std::unique_ptr<ByteSource> open_byte_source(const std::filesystem::path& path);
