#pragma once
#include "functions/byte_source/src/byte_source.hpp"

#include <algorithm>
#include <string>
#include <utility>

// in-memory source (테스트 전용)
class StringSource : public ByteSource {
public:
  explicit StringSource(std::string data) : data_(std::move(data)) {}

  std::size_t read(char *buf, std::size_t n) override {
    const std::size_t k = std::min(n, data_.size() - pos_);
    std::copy_n(data_.data() + pos_, k, buf);
    pos_ += k;
    return k;
  }
  std::string describe() const override { return "memory"; }

private:
  std::string data_;
  std::size_t pos_ = 0;
};
