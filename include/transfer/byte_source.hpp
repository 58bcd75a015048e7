#ifndef QUICKSHARE_BYTE_SOURCE_HPP
#define QUICKSHARE_BYTE_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace quickshare::transfer {

/// Random-access read interface over the file being sent.
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual std::uint64_t size() const = 0;
  /**
   * @brief Read @p length bytes at @p offset.
   * @throw RelayError(UploadFailed) on a short or failed read.
   */
  virtual std::vector<std::byte> read(std::uint64_t offset, std::size_t length) = 0;
};

class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::vector<std::byte> data) : data_(std::move(data)) {}
  std::uint64_t size() const override { return data_.size(); }
  std::vector<std::byte> read(std::uint64_t offset, std::size_t length) override;

private:
  std::vector<std::byte> data_;
};

/// Reads a file on disk; reads are serialized on one stream.
class FileByteSource : public ByteSource {
public:
  /// @throw RelayError(InvalidRequest) if @p path cannot be opened.
  explicit FileByteSource(const std::string &path);
  std::uint64_t size() const override { return size_; }
  std::vector<std::byte> read(std::uint64_t offset, std::size_t length) override;
  const std::string &path() const { return path_; }

private:
  std::string path_;
  std::ifstream in_;
  std::uint64_t size_ = 0;
  std::mutex mutex_;
};

} // namespace quickshare::transfer

#endif // QUICKSHARE_BYTE_SOURCE_HPP
