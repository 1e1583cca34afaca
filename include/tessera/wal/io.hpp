#pragma once

/** \file io.hpp
 *  \brief WAL writer and recovery scan (binary file IO). Little-endian framing.
 *
 * Notes
 * - Writer is not thread-safe; one writer per file, callers serialize appends.
 * - recover_scan is read-only and reentrant for independent paths.
 * - fsync is optional; flush(true) or fsync_on_flush performs an OS-level sync.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <string_view>

#include "tessera/error.hpp"
#include "tessera/wal/frame.hpp"

namespace tessera::wal {

/** \brief Statistics gathered during recovery scan. */
struct RecoveryStats {
  std::size_t frames{};             /**< number of delivered frames */
  std::uint64_t valid_bytes{};      /**< byte offset just past the last valid frame */
  std::uint64_t file_bytes{};       /**< file size at scan time */
  std::uint64_t last_lsn{};         /**< LSN of the last valid frame */
  bool torn_tail{false};            /**< trailing bytes after the last valid frame */
};

struct WalWriterStats {
  std::uint64_t frames{};
  std::uint64_t bytes{};
  std::uint64_t flushes{};
  std::uint64_t syncs{};
};

class WalWriter {
public:
  WalWriter() = default;
  ~WalWriter();
  WalWriter(WalWriter&&) noexcept;
  WalWriter& operator=(WalWriter&&) noexcept;
  WalWriter(const WalWriter&) = delete;
  WalWriter& operator=(const WalWriter&) = delete;

  /** Open for append; truncate=true starts an empty file. */
  static auto open(const std::filesystem::path& path, bool truncate = false, bool fsync_on_flush = false)
      -> std::expected<WalWriter, core::error>;

  auto append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
      -> std::expected<void, core::error>;

  /** Flush buffered data. If sync=true or fsync_on_flush, performs an OS-level sync. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** Flush, sync and close the file. */
  auto close() -> std::expected<void, core::error>;

  auto is_open() const noexcept -> bool { return out_.is_open(); }
  const std::filesystem::path& path() const noexcept { return path_; }
  const WalWriterStats& stats() const noexcept { return stats_; }

private:
  std::filesystem::path path_;
  bool fsync_on_flush_{false};
  WalWriterStats stats_{};
  std::ofstream out_;
};

// Sequentially scans a WAL file and invokes on_frame for each valid frame.
// Stops on torn/truncated tail without error; a callback error aborts the scan.
// A missing file yields not_found.
[[nodiscard]] auto recover_scan(const std::filesystem::path& path,
                                const std::function<std::expected<void, core::error>(const WalFrame&)>& on_frame)
    -> std::expected<RecoveryStats, core::error>;

// OS-level sync of a file or directory path.
auto fsync_path(const std::filesystem::path& p) -> std::expected<void, core::error>;

} // namespace tessera::wal
