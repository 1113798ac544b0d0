#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scriptbox {

/**
 * ZipWriter - builds a zip archive in memory.
 *
 * Entries are deflate-compressed (zlib raw deflate) with CRC-32 checksums.
 * No zip64, no encryption.
 */
class ZipWriter {
 public:
  /**
   * Add an entry. Returns false and sets error_out when compression fails.
   */
  bool AddFile(const std::string& name, const std::string& data,
               std::string* error_out = nullptr);

  /**
   * Append the central directory and return the archive bytes.
   */
  std::string Finish();

 private:
  struct Entry {
    std::string name;
    uint32_t crc = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_header_offset = 0;
  };

  std::string buffer_;
  std::vector<Entry> entries_;
};

inline constexpr size_t kDefaultMaxZipEntrySize = 256u * 1024 * 1024;

/**
 * ZipReader - reads entries of an in-memory zip archive through its
 * central directory. Supports stored and deflated entries.
 */
class ZipReader {
 public:
  /**
   * Parse the central directory. Returns false and sets error_out when the
   * bytes are not a readable zip archive.
   */
  bool Open(const std::string& bytes, std::string* error_out = nullptr);

  bool Contains(const std::string& name) const;

  /**
   * Largest uncompressed entry Read() will extract. Entries declaring more
   * are rejected before any allocation.
   */
  void SetMaxEntrySize(size_t bytes) { max_entry_size_ = bytes; }

  std::vector<std::string> Names() const;

  /**
   * Extract one entry, verifying its CRC-32.
   */
  bool Read(const std::string& name, std::string* data_out,
            std::string* error_out = nullptr) const;

 private:
  struct Entry {
    std::string name;
    uint16_t method = 0;
    uint32_t crc = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_header_offset = 0;
  };

  const Entry* Find(const std::string& name) const;

  std::string bytes_;
  std::vector<Entry> entries_;
  size_t max_entry_size_ = kDefaultMaxZipEntrySize;
};

}  // namespace scriptbox
