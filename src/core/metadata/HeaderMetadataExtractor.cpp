#include "HeaderMetadataExtractor.hpp"
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/storage/LocalFSBackend.hpp"

namespace {

using Bytes = std::vector<uint8_t>;
using TagMap = std::map<std::string, std::string>;

uint16_t be16(const uint8_t* p) { return static_cast<uint16_t>((p[0] << 8) | p[1]); }
uint32_t be32(const uint8_t* p) {
  return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3];
}
uint16_t le16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }
uint32_t le32(const uint8_t* p) {
  return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

bool readExact(std::istream& in, uint8_t* out, size_t n) {
  in.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
  return static_cast<size_t>(in.gcount()) == n;
}

std::string pixels(uint32_t v) { return std::to_string(v) + " pixels"; }

const char* tagName(uint16_t tag) {
  switch (tag) {
    case 0x010F: return "Make";
    case 0x0110: return "Model";
    case 0x0132: return "Date/Time";
    case 0x0100: return "Image Width";
    case 0x0101: return "Image Height";
    case 0x829A: return "Exposure Time";
    case 0x829D: return "F-Number";
    case 0x9003: return "Date/Time Original";
    case 0xA002: return "Exif Image Width";
    case 0xA003: return "Exif Image Height";
    default:     return nullptr;
  }
}

bool isDimensionTag(uint16_t tag) {
  return tag == 0x0100 || tag == 0x0101 || tag == 0xA002 || tag == 0xA003;
}

std::string describeRational(uint16_t tag, uint32_t num, uint32_t den) {
  char buf[64];
  if (den == 0) return "0";
  if (tag == 0x829D) {
    std::snprintf(buf, sizeof(buf), "f/%.1f", double(num) / den);
    return buf;
  }
  if (tag == 0x829A) {
    if (num == 0) return "0 sec";
    if (num < den) {
      std::snprintf(buf, sizeof(buf), "1/%.0f sec", double(den) / num);
    } else {
      std::snprintf(buf, sizeof(buf), "%g sec", double(num) / den);
    }
    return buf;
  }
  std::snprintf(buf, sizeof(buf), "%g", double(num) / den);
  return buf;
}

// Exif payload (TIFF structure) after the "Exif\0\0" preamble.
class TiffReader {
public:
  explicit TiffReader(const Bytes& data) : data_(data) {}

  void read(TagMap& tags) {
    if (!has(0, 8)) return;
    if (data_[0] == 'I' && data_[1] == 'I') little_ = true;
    else if (data_[0] == 'M' && data_[1] == 'M') little_ = false;
    else return;
    if (u16(2) != 42) return;
    readIfd(u32(4), tags, 0);
  }

private:
  bool has(size_t off, size_t n) const { return off <= data_.size() && n <= data_.size() - off; }
  uint16_t u16(size_t off) const { return little_ ? le16(&data_[off]) : be16(&data_[off]); }
  uint32_t u32(size_t off) const { return little_ ? le32(&data_[off]) : be32(&data_[off]); }

  void readIfd(size_t offset, TagMap& tags, int depth) {
    if (depth > 2 || !has(offset, 2)) return;
    const uint16_t count = u16(offset);
    for (uint16_t i = 0; i < count; ++i) {
      const size_t e = offset + 2 + size_t(i) * 12;
      if (!has(e, 12)) return;
      const uint16_t tag = u16(e);
      const uint16_t type = u16(e + 2);
      const uint32_t n = u32(e + 4);

      size_t unit = 0;
      switch (type) {
        case 2: unit = 1; break;  // ASCII
        case 3: unit = 2; break;  // SHORT
        case 4: unit = 4; break;  // LONG
        case 5: unit = 8; break;  // RATIONAL
        default: continue;
      }
      if (n == 0 || n > 0xFFFF) continue;
      const size_t total = unit * n;
      const size_t valueOff = total <= 4 ? e + 8 : u32(e + 8);
      if (!has(valueOff, total)) continue;

      if (tag == 0x8769 && (type == 4 || type == 3)) {  // Exif sub-IFD pointer
        readIfd(type == 4 ? u32(valueOff) : u16(valueOff), tags, depth + 1);
        continue;
      }

      const char* name = tagName(tag);
      if (!name) continue;

      switch (type) {
        case 2: {
          std::string s(reinterpret_cast<const char*>(&data_[valueOff]), total);
          while (!s.empty() && (s.back() == '\0' || s.back() == ' ')) s.pop_back();
          if (!s.empty()) tags[name] = s;
          break;
        }
        case 3:
          tags[name] = isDimensionTag(tag) ? pixels(u16(valueOff)) : std::to_string(u16(valueOff));
          break;
        case 4:
          tags[name] = isDimensionTag(tag) ? pixels(u32(valueOff)) : std::to_string(u32(valueOff));
          break;
        case 5:
          tags[name] = describeRational(tag, u32(valueOff), u32(valueOff + 4));
          break;
      }
    }
  }

  const Bytes& data_;
  bool little_ = false;
};

bool isStartOfFrame(uint8_t marker) {
  return marker >= 0xC0 && marker <= 0xCF &&
         marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
}

// Walks JPEG segments after SOI up to the start of scan.
std::optional<ImageMetadata> readJpeg(std::istream& in, const CancellationToken& token) {
  ImageMetadata md;
  bool sawFrame = false;

  for (int segments = 0; segments < 1024; ++segments) {
    token.throwIfCancelled();
    uint8_t m[2];
    if (!readExact(in, m, 2) || m[0] != 0xFF) break;
    uint8_t marker = m[1];
    while (marker == 0xFF) {
      if (!readExact(in, &marker, 1)) return std::nullopt;
    }
    if (marker == 0xD9 || marker == 0xDA) break;
    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) continue;

    uint8_t lenBytes[2];
    if (!readExact(in, lenBytes, 2)) break;
    const uint16_t len = be16(lenBytes);
    if (len < 2) break;
    Bytes seg(len - 2);
    if (!seg.empty() && !readExact(in, seg.data(), seg.size())) break;

    if (marker == 0xE1 && seg.size() > 14 && std::memcmp(seg.data(), "Exif\0\0", 6) == 0) {
      Bytes tiff(seg.begin() + 6, seg.end());
      TiffReader(tiff).read(md.tags);
    } else if (isStartOfFrame(marker) && seg.size() >= 5) {
      md.height = be16(&seg[1]);
      md.width  = be16(&seg[3]);
      sawFrame = true;
    }
  }

  if (!sawFrame) return std::nullopt;
  return md;
}

// Dimensions outside int range are treated as a corrupt header.
bool fitsInt(int64_t v) { return v >= 0 && v <= std::numeric_limits<int>::max(); }

std::optional<ImageMetadata> readFixedHeader(const uint8_t* h, size_t n) {
  static const uint8_t kPng[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  ImageMetadata md;

  if (n >= 24 && std::memcmp(h, kPng, 8) == 0 && std::memcmp(h + 12, "IHDR", 4) == 0) {
    const int64_t w = be32(h + 16);
    const int64_t hgt = be32(h + 20);
    if (!fitsInt(w) || !fitsInt(hgt)) return std::nullopt;
    md.width  = static_cast<int>(w);
    md.height = static_cast<int>(hgt);
    return md;
  }
  if (n >= 10 && (std::memcmp(h, "GIF87a", 6) == 0 || std::memcmp(h, "GIF89a", 6) == 0)) {
    md.width  = le16(h + 6);
    md.height = le16(h + 8);
    return md;
  }
  if (n >= 26 && h[0] == 'B' && h[1] == 'M') {
    const uint32_t dibSize = le32(h + 14);
    if (dibSize == 12) {
      md.width  = le16(h + 18);
      md.height = le16(h + 20);
    } else {
      int64_t w = static_cast<int32_t>(le32(h + 18));
      int64_t hgt = static_cast<int32_t>(le32(h + 22));
      if (w < 0) w = -w;
      if (hgt < 0) hgt = -hgt;  // negative height means top-down rows
      if (!fitsInt(w) || !fitsInt(hgt)) return std::nullopt;
      md.width  = static_cast<int>(w);
      md.height = static_cast<int>(hgt);
    }
    return md;
  }
  return std::nullopt;
}

} // namespace

std::optional<ImageMetadata> HeaderMetadataExtractor::extract(const std::string& path,
                                                              const std::vector<std::string>& fields,
                                                              const CancellationToken& token) {
  token.throwIfCancelled();

  std::ifstream in;
  try {
    in = fs_.openRead(path);
  } catch (const IoError& e) {
    spdlog::warn("metadata: {}", e.what());
    return std::nullopt;
  }

  uint8_t header[26] = {};
  in.read(reinterpret_cast<char*>(header), 2);
  if (in.gcount() != 2) {
    spdlog::warn("metadata: {} is too short to be an image", path);
    return std::nullopt;
  }

  std::optional<ImageMetadata> md;
  if (header[0] == 0xFF && header[1] == 0xD8) {
    md = readJpeg(in, token);
  } else {
    in.read(reinterpret_cast<char*>(header + 2), sizeof(header) - 2);
    md = readFixedHeader(header, 2 + static_cast<size_t>(in.gcount()));
  }

  if (!md) {
    spdlog::warn("metadata: unrecognized or truncated image header in {}", path);
    return std::nullopt;
  }

  if (md->width > 0) md->tags.emplace("Image Width", pixels(static_cast<uint32_t>(md->width)));
  if (md->height > 0) md->tags.emplace("Image Height", pixels(static_cast<uint32_t>(md->height)));

  for (auto it = md->tags.begin(); it != md->tags.end();) {
    if (field_requested(fields, it->first)) ++it;
    else it = md->tags.erase(it);
  }
  return md;
}
