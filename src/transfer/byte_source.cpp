#include "transfer/byte_source.hpp"

#include "utilities/relay_error.hpp"

#include <algorithm>

namespace quickshare::transfer {

std::vector<std::byte> MemoryByteSource::read(std::uint64_t offset, std::size_t length) {
  if (offset > data_.size() || length > data_.size() - offset) {
    throw RelayError(ErrorCode::UploadFailed,
                     "Read past end of buffer at offset " + std::to_string(offset));
  }
  auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
  return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(length));
}

FileByteSource::FileByteSource(const std::string &path)
    : path_(path), in_(path, std::ios::binary | std::ios::ate) {
  if (!in_.is_open()) {
    throw RelayError(ErrorCode::InvalidRequest, "Cannot open " + path);
  }
  size_ = static_cast<std::uint64_t>(in_.tellg());
  in_.seekg(0);
}

std::vector<std::byte> FileByteSource::read(std::uint64_t offset, std::size_t length) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::byte> out(length);
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset));
  in_.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(length));
  if (static_cast<std::size_t>(in_.gcount()) != length) {
    throw RelayError(ErrorCode::UploadFailed,
                     "Short read from " + path_ + " at offset " + std::to_string(offset));
  }
  return out;
}

} // namespace quickshare::transfer
