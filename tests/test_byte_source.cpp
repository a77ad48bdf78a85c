#include "functions/byte_source/src/byte_source.hpp"
#include "functions/filter_error/src/filter_error.hpp"

#include <zip.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

void check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << '\n';
    std::exit(1);
  }
}

fs::path make_temp_dir() {
  std::random_device rd;
  const fs::path dir = fs::temp_directory_path() / ("p2pkh_byte_source_" + std::to_string(rd()));
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path &p, const std::string &data) {
  std::ofstream ofs(p, std::ios::binary);
  ofs << data;
}

std::string drain(ByteSource &src, std::size_t chunk) {
  std::string out;
  std::string buf(chunk, '\0');
  while (std::size_t n = src.read(buf.data(), buf.size())) {
    out.append(buf.data(), n);
  }
  return out;
}

// entries: (name, data). 이름이 '/'로 끝나면 디렉토리
void make_zip(const fs::path &p, const std::vector<std::pair<std::string, std::string>> &entries) {
  int err = 0;
  zip_t *z = zip_open(p.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
  check(z != nullptr, "zip_open for writing");
  for (const auto &[name, data] : entries) {
    if (!name.empty() && name.back() == '/') {
      check(zip_dir_add(z, name.c_str(), ZIP_FL_ENC_UTF_8) >= 0, "zip_dir_add");
      continue;
    }
    zip_source_t *src = zip_source_buffer(z, data.data(), data.size(), 0);
    check(src != nullptr, "zip_source_buffer");
    check(zip_file_add(z, name.c_str(), src, ZIP_FL_OVERWRITE) >= 0, "zip_file_add");
  }
  check(zip_close(z) == 0, "zip_close");
}

void test_file_source(const fs::path &dir) {
  const fs::path p = dir / "plain.txt";
  const std::string data = "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa\r\nsecond\n";
  write_file(p, data);

  FileByteSource src(p);
  check(drain(src, 7) == data, "file source returns bytes unchanged");
  check(src.read(nullptr, 0) == 0, "read after eof");
  check(src.describe() == p.string(), "file source description");
}

void test_missing_file(const fs::path &dir) {
  bool thrown = false;
  try {
    FileByteSource src(dir / "missing.txt");
  } catch (const FilterError &e) {
    thrown = e.kind() == FilterErrorKind::InputNotFound;
  }
  check(thrown, "missing file reports InputNotFound");
}

void test_unreadable_file(const fs::path &dir) {
  const fs::path p = dir / "locked.txt";
  write_file(p, "x\n");
  fs::permissions(p, fs::perms::none);

  // root 는 권한 비트를 무시하므로 건너뜀
  if (std::ifstream(p)) {
    fs::permissions(p, fs::perms::owner_all);
    return;
  }
  bool thrown = false;
  try {
    FileByteSource src(p);
  } catch (const FilterError &e) {
    thrown = e.kind() == FilterErrorKind::PermissionDenied &&
             std::string(e.what()).find("Permission denied") != std::string::npos;
  }
  fs::permissions(p, fs::perms::owner_all);
  check(thrown, "unreadable file reports PermissionDenied");
}

// 권한 비트와 무관하게 errno -> 분류 규칙 확인 (root 에서도 실행됨)
void test_open_error_mapping() {
  const std::string p = "/data/addresses.txt";

  const FilterError read_denied = open_error("read", p, EACCES);
  check(read_denied.kind() == FilterErrorKind::PermissionDenied, "EACCES on read is PermissionDenied");
  check(std::string(read_denied.what()) == "Permission denied. Cannot read '/data/addresses.txt'.",
        "read permission message");

  const FilterError write_denied = open_error("write to", p, EPERM);
  check(write_denied.kind() == FilterErrorKind::PermissionDenied, "EPERM on write is PermissionDenied");
  check(std::string(write_denied.what()) == "Permission denied. Cannot write to '/data/addresses.txt'.",
        "write permission message");

  const FilterError vanished = open_error("read", p, ENOENT);
  check(vanished.kind() == FilterErrorKind::InputNotFound, "ENOENT on read is InputNotFound");
  check(std::string(vanished.what()) == "File '/data/addresses.txt' not found.", "not found message");

  const FilterError no_dir = open_error("write to", p, ENOENT);
  check(no_dir.kind() == FilterErrorKind::Io, "ENOENT on write is an I/O error");
  check(std::string(no_dir.what()).find("OS error - cannot write to '/data/addresses.txt': ") == 0,
        "write I/O message names the path");
  check(std::string(no_dir.what()).find(std::strerror(ENOENT)) != std::string::npos,
        "write I/O message carries strerror text");

  const FilterError unknown = open_error("read", p, 0);
  check(unknown.kind() == FilterErrorKind::Io, "errno 0 is an I/O error");
  check(std::string(unknown.what()).find("unknown error") != std::string::npos, "errno 0 message");
}

void test_zip_source(const fs::path &dir) {
  const fs::path p = dir / "addresses.zip";
  std::string data;
  for (int i = 0; i < 5000; ++i) {
    data += "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa\n";
  }
  make_zip(p, {{"dump/", ""}, {"dump/addresses.txt", data}, {"dump/readme.txt", "hello"}});

  ZipEntrySource src(p);
  check(src.entry_name() == "dump/addresses.txt", "first file entry is chosen");
  check(src.file_entries() == 2, "file entry count skips directories");
  check(drain(src, 4096) == data, "zip entry streamed completely");
  check(src.describe() == p.string() + ":dump/addresses.txt", "zip source description");
}

void test_zip_without_files(const fs::path &dir) {
  const fs::path p = dir / "empty-dirs.zip";
  make_zip(p, {{"only-a-dir/", ""}});
  bool thrown = false;
  try {
    ZipEntrySource src(p);
  } catch (const FilterError &e) {
    thrown = e.kind() == FilterErrorKind::Io;
  }
  check(thrown, "archive without file entries is an I/O error");
}

void test_not_a_zip(const fs::path &dir) {
  const fs::path p = dir / "fake.zip";
  write_file(p, "this is not an archive\n");
  bool thrown = false;
  try {
    ZipEntrySource src(p);
  } catch (const FilterError &e) {
    thrown = e.kind() == FilterErrorKind::Io &&
             std::string(e.what()).find("zip_open failed") != std::string::npos;
  }
  check(thrown, "corrupt archive is an I/O error");
}

void test_dispatch(const fs::path &dir) {
  check(is_zip_path("a/b/dump.zip"), ".zip");
  check(is_zip_path("DUMP.ZIP"), ".ZIP");
  check(!is_zip_path("dump.txt"), ".txt");
  check(!is_zip_path("zip"), "no extension");

  auto plain = open_byte_source(dir / "plain.txt");
  check(dynamic_cast<FileByteSource *>(plain.get()) != nullptr, "text path opens a file source");
  auto zipped = open_byte_source(dir / "addresses.zip");
  check(dynamic_cast<ZipEntrySource *>(zipped.get()) != nullptr, "zip path opens a zip source");
}

} // namespace

int main() {
  const fs::path dir = make_temp_dir();
  test_file_source(dir);
  test_missing_file(dir);
  test_unreadable_file(dir);
  test_open_error_mapping();
  test_zip_source(dir);
  test_zip_without_files(dir);
  test_not_a_zip(dir);
  test_dispatch(dir);
  fs::remove_all(dir);
  std::cout << "byte source tests passed\n";
  return 0;
}
