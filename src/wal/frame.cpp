#include "tessera/wal/frame.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace tessera::wal {

namespace {

constexpr std::size_t kTrailerSize = 4;

constexpr auto make_crc_table() -> std::array<std::uint32_t, 256> {
  // Castagnoli polynomial, bit-reversed
  constexpr std::uint32_t kPoly = 0x82F63B78u;
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t n = 0; n < table.size(); ++n) {
    std::uint32_t r = n;
    for (int bit = 0; bit < 8; ++bit) r = (r >> 1) ^ (kPoly & (0u - (r & 1u)));
    table[n] = r;
  }
  return table;
}

constexpr auto kCrcTable = make_crc_table();

/** \brief Appends little-endian fields to a preallocated frame buffer. */
class FrameWriter {
public:
  explicit FrameWriter(std::vector<std::uint8_t>& out) : out_(out) {}

  template <class T>
  auto put(T value) -> void {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      out_[pos_++] = static_cast<std::uint8_t>(static_cast<std::uint64_t>(value) >> (8 * i));
    }
  }

  auto put(std::span<const std::uint8_t> bytes) -> void {
    std::copy(bytes.begin(), bytes.end(), out_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ += bytes.size();
  }

  auto written() const -> std::span<const std::uint8_t> { return {out_.data(), pos_}; }

private:
  std::vector<std::uint8_t>& out_;
  std::size_t pos_{0};
};

/** \brief Reads little-endian fields; the caller checks the length first. */
class FrameReader {
public:
  explicit FrameReader(std::span<const std::uint8_t> in, std::size_t at = 0) : in_(in), pos_(at) {}

  template <class T>
  auto get() -> T {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) v |= static_cast<std::uint64_t>(in_[pos_++]) << (8 * i);
    return static_cast<T>(v);
  }

private:
  std::span<const std::uint8_t> in_;
  std::size_t pos_;
};

auto stored_crc(std::span<const std::uint8_t> frame) -> std::uint32_t {
  return FrameReader(frame, frame.size() - kTrailerSize).get<std::uint32_t>();
}

} // namespace

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t state = 0xFFFFFFFFu;
  for (const std::uint8_t byte : bytes) state = (state >> 8) ^ kCrcTable[(state ^ byte) & 0xFFu];
  return state ^ 0xFFFFFFFFu;
}

auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool {
  if (full_frame.size() < WAL_HEADER_SIZE + kTrailerSize) return false;
  return stored_crc(full_frame) == crc32c(full_frame.first(full_frame.size() - kTrailerSize));
}

auto encode_frame(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  const std::size_t total = WAL_HEADER_SIZE + payload.size() + kTrailerSize;
  if (total > MAX_FRAME_LEN) {
    return core::fail(core::error_code::precondition_failed,
                      "frame of " + std::to_string(total) + " bytes exceeds the frame limit", "wal.frame");
  }

  std::vector<std::uint8_t> frame(total);
  FrameWriter w(frame);
  w.put(WAL_MAGIC);
  w.put(static_cast<std::uint32_t>(total));
  w.put(type);
  w.put(std::uint16_t{0});
  w.put(lsn);
  w.put(payload);
  w.put(crc32c(w.written()));
  return frame;
}

auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<WalFrame, core::error> {
  using core::error_code;
  if (bytes.size() < WAL_HEADER_SIZE + kTrailerSize) {
    return core::fail(error_code::precondition_failed, "frame too short", "wal.frame");
  }

  WalFrame frame{};
  FrameReader r(bytes);
  frame.magic = r.get<std::uint32_t>();
  frame.len = r.get<std::uint32_t>();
  frame.type = r.get<std::uint16_t>();
  frame.reserved = r.get<std::uint16_t>();
  frame.lsn = r.get<std::uint64_t>();

  if (frame.magic != WAL_MAGIC) return core::fail(error_code::data_integrity, "bad magic", "wal.frame");
  if (frame.len != bytes.size()) return core::fail(error_code::precondition_failed, "len mismatch", "wal.frame");
  if (frame.reserved != 0) return core::fail(error_code::precondition_failed, "reserved != 0", "wal.frame");

  frame.crc32c = stored_crc(bytes);
  if (frame.crc32c != crc32c(bytes.first(bytes.size() - kTrailerSize))) {
    return core::fail(error_code::data_integrity, "crc mismatch", "wal.frame");
  }
  frame.payload = bytes.subspan(WAL_HEADER_SIZE, bytes.size() - WAL_HEADER_SIZE - kTrailerSize);
  return frame;
}

} // namespace tessera::wal
