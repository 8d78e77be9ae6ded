#ifndef ICA_SECURE_BUFFER_H
#define ICA_SECURE_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ica::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  volatile std::uint8_t* p = reinterpret_cast<volatile std::uint8_t*>(data);
  while (len--) {
    *p++ = 0;
  }
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

inline void SecureWipe(std::string& text) {
  SecureWipe(text.empty() ? nullptr : &text[0], text.size());
}

// Zeroes a caller-owned buffer when the scope ends.
class ScopedWipe {
 public:
  explicit ScopedWipe(std::vector<std::uint8_t>& buf)
      : data_(buf.data()), len_(buf.size()) {}

  explicit ScopedWipe(std::string& text)
      : data_(text.empty() ? nullptr : &text[0]), len_(text.size()) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() {
    if (data_ && len_ > 0) {
      SecureWipe(data_, len_);
    }
  }

 private:
  void* data_{nullptr};
  std::size_t len_{0};
};

// Byte buffer that zeroes its contents on destruction and on move-assign.
class SecureBuffer {
 public:
  SecureBuffer() = default;
  explicit SecureBuffer(std::size_t size) : data_(size) {}

  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;

  SecureBuffer(SecureBuffer&& other) noexcept
      : data_(std::move(other.data_)) {
    other.data_.clear();
  }

  SecureBuffer& operator=(SecureBuffer&& other) noexcept {
    if (this == &other) {
      return *this;
    }
    SecureWipe(data_);
    data_ = std::move(other.data_);
    other.data_.clear();
    return *this;
  }

  ~SecureBuffer() { SecureWipe(data_); }

  std::uint8_t* data() { return data_.data(); }
  const std::uint8_t* data() const { return data_.data(); }
  std::size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  void assign(const std::uint8_t* data, std::size_t len) {
    SecureWipe(data_);
    data_.assign(data, data + len);
  }

  const std::vector<std::uint8_t>& bytes() const { return data_; }

 private:
  std::vector<std::uint8_t> data_;
};

}  // namespace ica::common

#endif  // ICA_SECURE_BUFFER_H
