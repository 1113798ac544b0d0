#include "spreadsheet/zip_archive.h"

#include <cstring>

#include <fmt/format.h>
#include <zlib.h>

namespace scriptbox {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;

constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflate = 8;

// Deflate cannot expand data by more than ~1032:1
constexpr uint64_t kMaxDeflateRatio = 1032;
constexpr size_t kInflateChunk = 64 * 1024;

// MS-DOS date/time for 1980-01-01 00:00 (archives are reproducible)
constexpr uint16_t kDosTime = 0;
constexpr uint16_t kDosDate = (0 << 9) | (1 << 5) | 1;

void PutU16(std::string& out, uint16_t v) {
  out.push_back(static_cast<char>(v & 0xff));
  out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void PutU32(std::string& out, uint32_t v) {
  for (int i = 0; i < 4; i++) {
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
  }
}

uint16_t GetU16(const std::string& in, size_t pos) {
  return static_cast<uint16_t>(static_cast<uint8_t>(in[pos]) |
                               (static_cast<uint8_t>(in[pos + 1]) << 8));
}

uint32_t GetU32(const std::string& in, size_t pos) {
  return static_cast<uint32_t>(static_cast<uint8_t>(in[pos])) |
         (static_cast<uint32_t>(static_cast<uint8_t>(in[pos + 1])) << 8) |
         (static_cast<uint32_t>(static_cast<uint8_t>(in[pos + 2])) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(in[pos + 3])) << 24);
}

uint32_t Crc32(const std::string& data) {
  uLong crc = crc32(0L, Z_NULL, 0);
  return static_cast<uint32_t>(
      crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
}

bool RawDeflate(const std::string& in, std::string* out, std::string* error_out) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  // Negative window bits: raw deflate stream without zlib header
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    if (error_out) *error_out = "deflateInit2 failed";
    return false;
  }
  out->resize(deflateBound(&zs, static_cast<uLong>(in.size())));
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  zs.next_out = reinterpret_cast<Bytef*>(&(*out)[0]);
  zs.avail_out = static_cast<uInt>(out->size());

  int ret = deflate(&zs, Z_FINISH);
  if (ret != Z_STREAM_END) {
    deflateEnd(&zs);
    if (error_out) *error_out = "deflate failed";
    return false;
  }
  out->resize(zs.total_out);
  deflateEnd(&zs);
  return true;
}

bool RawInflate(const char* data, size_t size, size_t expected, std::string* out,
                std::string* error_out) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
    if (error_out) *error_out = "inflateInit2 failed";
    return false;
  }
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
  zs.avail_in = static_cast<uInt>(size);

  // Grow the output as data arrives; the declared size is only an upper bound
  out->clear();
  char chunk[kInflateChunk];
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    zs.next_out = reinterpret_cast<Bytef*>(chunk);
    zs.avail_out = sizeof(chunk);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) break;
    size_t produced = sizeof(chunk) - zs.avail_out;
    if (out->size() + produced > expected) {
      ret = Z_DATA_ERROR;
      break;
    }
    out->append(chunk, produced);
    if (ret == Z_OK && produced == 0 && zs.avail_in == 0) {
      ret = Z_BUF_ERROR;
      break;
    }
  }
  inflateEnd(&zs);
  if (ret != Z_STREAM_END || out->size() != expected) {
    out->clear();
    if (error_out) *error_out = "Corrupt deflate stream";
    return false;
  }
  return true;
}

}  // namespace

bool ZipWriter::AddFile(const std::string& name, const std::string& data,
                        std::string* error_out) {
  std::string compressed;
  if (!RawDeflate(data, &compressed, error_out)) {
    return false;
  }

  Entry entry;
  entry.name = name;
  entry.crc = Crc32(data);
  entry.compressed_size = static_cast<uint32_t>(compressed.size());
  entry.uncompressed_size = static_cast<uint32_t>(data.size());
  entry.local_header_offset = static_cast<uint32_t>(buffer_.size());

  PutU32(buffer_, kLocalHeaderSig);
  PutU16(buffer_, 20);  // version needed
  PutU16(buffer_, 0);   // flags
  PutU16(buffer_, kMethodDeflate);
  PutU16(buffer_, kDosTime);
  PutU16(buffer_, kDosDate);
  PutU32(buffer_, entry.crc);
  PutU32(buffer_, entry.compressed_size);
  PutU32(buffer_, entry.uncompressed_size);
  PutU16(buffer_, static_cast<uint16_t>(name.size()));
  PutU16(buffer_, 0);  // extra length
  buffer_ += name;
  buffer_ += compressed;

  entries_.push_back(entry);
  return true;
}

std::string ZipWriter::Finish() {
  uint32_t central_offset = static_cast<uint32_t>(buffer_.size());
  for (const auto& entry : entries_) {
    PutU32(buffer_, kCentralHeaderSig);
    PutU16(buffer_, 20);  // version made by
    PutU16(buffer_, 20);  // version needed
    PutU16(buffer_, 0);   // flags
    PutU16(buffer_, kMethodDeflate);
    PutU16(buffer_, kDosTime);
    PutU16(buffer_, kDosDate);
    PutU32(buffer_, entry.crc);
    PutU32(buffer_, entry.compressed_size);
    PutU32(buffer_, entry.uncompressed_size);
    PutU16(buffer_, static_cast<uint16_t>(entry.name.size()));
    PutU16(buffer_, 0);  // extra length
    PutU16(buffer_, 0);  // comment length
    PutU16(buffer_, 0);  // disk number
    PutU16(buffer_, 0);  // internal attributes
    PutU32(buffer_, 0);  // external attributes
    PutU32(buffer_, entry.local_header_offset);
    buffer_ += entry.name;
  }
  uint32_t central_size = static_cast<uint32_t>(buffer_.size()) - central_offset;

  PutU32(buffer_, kEndOfCentralDirSig);
  PutU16(buffer_, 0);  // this disk
  PutU16(buffer_, 0);  // central directory disk
  PutU16(buffer_, static_cast<uint16_t>(entries_.size()));
  PutU16(buffer_, static_cast<uint16_t>(entries_.size()));
  PutU32(buffer_, central_size);
  PutU32(buffer_, central_offset);
  PutU16(buffer_, 0);  // comment length

  std::string out;
  out.swap(buffer_);
  entries_.clear();
  return out;
}

bool ZipReader::Open(const std::string& bytes, std::string* error_out) {
  bytes_ = bytes;
  entries_.clear();

  if (bytes_.size() < 22) {
    if (error_out) *error_out = "Not a zip archive (too short)";
    return false;
  }

  // End of central directory: scan back over a possible archive comment
  size_t eocd = std::string::npos;
  size_t min_pos = bytes_.size() > 22 + 0xffff ? bytes_.size() - 22 - 0xffff : 0;
  for (size_t pos = bytes_.size() - 22 + 1; pos-- > min_pos;) {
    if (GetU32(bytes_, pos) == kEndOfCentralDirSig) {
      eocd = pos;
      break;
    }
  }
  if (eocd == std::string::npos) {
    if (error_out) *error_out = "Not a zip archive (no end of central directory)";
    return false;
  }

  uint16_t count = GetU16(bytes_, eocd + 10);
  uint32_t central_offset = GetU32(bytes_, eocd + 16);
  size_t pos = central_offset;

  for (uint16_t i = 0; i < count; i++) {
    if (pos + 46 > bytes_.size() || GetU32(bytes_, pos) != kCentralHeaderSig) {
      if (error_out) *error_out = "Corrupt zip central directory";
      return false;
    }
    Entry entry;
    entry.method = GetU16(bytes_, pos + 10);
    entry.crc = GetU32(bytes_, pos + 16);
    entry.compressed_size = GetU32(bytes_, pos + 20);
    entry.uncompressed_size = GetU32(bytes_, pos + 24);
    uint16_t name_len = GetU16(bytes_, pos + 28);
    uint16_t extra_len = GetU16(bytes_, pos + 30);
    uint16_t comment_len = GetU16(bytes_, pos + 32);
    entry.local_header_offset = GetU32(bytes_, pos + 42);
    if (pos + 46 + name_len > bytes_.size()) {
      if (error_out) *error_out = "Corrupt zip central directory";
      return false;
    }
    entry.name = bytes_.substr(pos + 46, name_len);
    entries_.push_back(entry);
    pos += 46 + name_len + extra_len + comment_len;
  }
  return true;
}

const ZipReader::Entry* ZipReader::Find(const std::string& name) const {
  for (const auto& entry : entries_) {
    if (entry.name == name) return &entry;
  }
  return nullptr;
}

bool ZipReader::Contains(const std::string& name) const {
  return Find(name) != nullptr;
}

std::vector<std::string> ZipReader::Names() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& entry : entries_) {
    names.push_back(entry.name);
  }
  return names;
}

bool ZipReader::Read(const std::string& name, std::string* data_out,
                     std::string* error_out) const {
  const Entry* entry = Find(name);
  if (!entry) {
    if (error_out) *error_out = "Missing zip entry: " + name;
    return false;
  }

  size_t pos = entry->local_header_offset;
  if (pos + 30 > bytes_.size() || GetU32(bytes_, pos) != kLocalHeaderSig) {
    if (error_out) *error_out = "Corrupt zip local header: " + name;
    return false;
  }
  size_t data_start = pos + 30 + GetU16(bytes_, pos + 26) + GetU16(bytes_, pos + 28);
  if (data_start + entry->compressed_size > bytes_.size()) {
    if (error_out) *error_out = "Truncated zip entry: " + name;
    return false;
  }

  if (entry->uncompressed_size > max_entry_size_) {
    if (error_out) {
      *error_out = fmt::format("Zip entry too large: {} ({} bytes, limit {})", name,
                               entry->uncompressed_size, max_entry_size_);
    }
    return false;
  }
  if (entry->method == kMethodDeflate &&
      entry->uncompressed_size >
          static_cast<uint64_t>(entry->compressed_size) * kMaxDeflateRatio + kInflateChunk) {
    if (error_out) *error_out = "Implausible compression ratio in zip entry: " + name;
    return false;
  }

  if (entry->method == kMethodStored) {
    data_out->assign(bytes_, data_start, entry->compressed_size);
  } else if (entry->method == kMethodDeflate) {
    if (!RawInflate(bytes_.data() + data_start, entry->compressed_size,
                    entry->uncompressed_size, data_out, error_out)) {
      if (error_out) *error_out += ": " + name;
      return false;
    }
  } else {
    if (error_out) *error_out = "Unsupported zip compression method in " + name;
    return false;
  }

  if (Crc32(*data_out) != entry->crc) {
    if (error_out) *error_out = "CRC mismatch in zip entry: " + name;
    return false;
  }
  return true;
}

}  // namespace scriptbox
