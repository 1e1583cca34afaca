#pragma once

/** \file frame.hpp
 *  \brief WAL frame encode/decode and CRC32C verification (pure, in-memory).
 *
 * Layout: magic u32 | len u32 | type u16 | reserved u16 | lsn u64 | payload | crc32c u32
 * Endianness: little-endian framing on all platforms.
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with tessera::core::error.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "tessera/error.hpp"

namespace tessera::wal {

constexpr std::uint32_t WAL_MAGIC = 0x4C575354u; // "TSWL"
constexpr std::size_t WAL_HEADER_SIZE = 4 + 4 + 2 + 2 + 8; // 20 bytes
constexpr std::uint32_t MAX_FRAME_LEN = 32u * 1024u * 1024u; // 32 MiB

/** \brief Frame types written by the document store. */
enum class FrameType : std::uint16_t { upsert = 1, remove = 2 };

struct WalFrame {
  std::uint32_t magic;
  std::uint32_t len;       // total length including header+payload+CRC
  std::uint16_t type;      // FrameType
  std::uint16_t reserved;  // 0
  std::uint64_t lsn;       // log sequence number
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t crc32c;    // Castagnoli over [magic..payload]
};

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Verify CRC32C of a full frame buffer (includes CRC at the end)
auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool;

// Encode a frame into a contiguous byte vector; fails when the payload exceeds MAX_FRAME_LEN
auto encode_frame(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Decode a frame from a contiguous buffer (no allocations for payload)
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<WalFrame, core::error>;

} // namespace tessera::wal
