#include "tessera/wal/io.hpp"

#include <cstring>
#include <vector>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace tessera::wal {

auto fsync_path(const std::filesystem::path& p) -> std::expected<void, core::error> {
  using core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return core::fail(error_code::io_failed, "fsync open failed: " + p.string(), "wal.io");
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return core::fail(error_code::io_failed, "fsync failed: " + p.string(), "wal.io");
  }
#else
  (void)p;
#endif
  return {};
}

WalWriter::~WalWriter() {
  if (out_.is_open()) out_.flush();
}

WalWriter::WalWriter(WalWriter&&) noexcept = default;
WalWriter& WalWriter::operator=(WalWriter&&) noexcept = default;

auto WalWriter::open(const std::filesystem::path& p, bool truncate, bool fsync_on_flush)
    -> std::expected<WalWriter, core::error> {
  using core::error_code;
  WalWriter w;
  w.path_ = p;
  w.fsync_on_flush_ = fsync_on_flush;
  const auto mode = std::ios::binary | std::ios::out | (truncate ? std::ios::trunc : std::ios::app);
  w.out_.open(w.path_, mode);
  if (!w.out_.good()) {
    return core::fail(error_code::io_failed, "open failed: " + p.string(), "wal.io");
  }
  return w;
}

auto WalWriter::append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
  using core::error_code;
  auto enc = encode_frame(lsn, type, payload);
  if (!enc) return std::unexpected(enc.error());
  if (!out_.is_open() || !out_.good()) {
    return core::fail(error_code::io_failed, "writer closed", "wal.io");
  }
  out_.write(reinterpret_cast<const char*>(enc->data()), static_cast<std::streamsize>(enc->size()));
  if (!out_.good()) return core::fail(error_code::io_failed, "write failed", "wal.io");
  stats_.frames++;
  stats_.bytes += enc->size();
  return {};
}

auto WalWriter::flush(bool sync) -> std::expected<void, core::error> {
  using core::error_code;
  if (!out_.good()) return core::fail(error_code::io_failed, "writer closed", "wal.io");
  out_.flush(); stats_.flushes++;
  if (!out_.good()) return core::fail(error_code::io_failed, "flush failed", "wal.io");
  if (sync || fsync_on_flush_) {
    if (auto r = fsync_path(path_); !r) return r;
    stats_.syncs++;
  }
  return {};
}

auto WalWriter::close() -> std::expected<void, core::error> {
  if (!out_.is_open()) return {};
  auto r = flush(true);
  out_.close();
  return r;
}

namespace {
auto read_exact(std::ifstream& in, std::vector<std::uint8_t>& buf, std::size_t n) -> bool {
  buf.resize(n);
  in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
  return static_cast<std::size_t>(in.gcount()) == n;
}
}

auto recover_scan(const std::filesystem::path& p,
                  const std::function<std::expected<void, core::error>(const WalFrame&)>& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  using core::error_code;
  RecoveryStats stats{};
  std::error_code fec{};
  if (!std::filesystem::exists(p, fec)) {
    return core::fail(error_code::not_found, "no wal at " + p.string(), "wal.io");
  }
  stats.file_bytes = std::filesystem::file_size(p, fec);
  if (fec) return core::fail(error_code::io_failed, "stat failed: " + p.string(), "wal.io");

  std::ifstream in(p, std::ios::binary);
  if (!in.good()) return core::fail(error_code::io_failed, "open failed: " + p.string(), "wal.io");

  std::vector<std::uint8_t> hdr;
  std::vector<std::uint8_t> rest;
  while (true) {
    // EOF or partial header -> stop without error (torn tail)
    if (!read_exact(in, hdr, WAL_HEADER_SIZE)) break;
    // Validate header magic and LEN before allocating
    std::uint32_t magic; std::memcpy(&magic, hdr.data(), 4);
    if (magic != WAL_MAGIC) break;
    std::uint32_t len; std::memcpy(&len, hdr.data() + 4, 4);
    if (len < WAL_HEADER_SIZE + 4 || len > MAX_FRAME_LEN) break;
    const std::uint64_t rest_len = static_cast<std::uint64_t>(len) - WAL_HEADER_SIZE;
    if (stats.valid_bytes + WAL_HEADER_SIZE + rest_len > stats.file_bytes) break;

    if (!read_exact(in, rest, static_cast<std::size_t>(rest_len))) break;
    std::vector<std::uint8_t> frame = hdr;
    frame.insert(frame.end(), rest.begin(), rest.end());

    auto dec = decode_frame(frame);
    if (!dec) break;

    if (auto r = on_frame(*dec); !r) return std::unexpected(r.error());
    stats.frames += 1;
    stats.valid_bytes += frame.size();
    stats.last_lsn = dec->lsn;
  }
  stats.torn_tail = stats.valid_bytes < stats.file_bytes;
  return stats;
}

} // namespace tessera::wal
