#pragma once

/** \file record_codec.hpp
 *  \brief Binary encoding of document store records carried in WAL frame payloads.
 *
 * Upsert:  id | u32 dim | f32[dim] | payload
 * Remove:  id
 * id:      u8 tag (0 = u64, 1 = string) | u64 or (u32 len | bytes)
 * payload: tagged value tree (null, bool, i64, f64, string, array, object), little-endian.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "tessera/document.hpp"
#include "tessera/error.hpp"

namespace tessera::store {

auto encode_upsert(const Document& doc) -> std::vector<std::uint8_t>;
auto encode_remove(const DocumentId& id) -> std::vector<std::uint8_t>;

/** \brief Decode an upsert record. Errors: data_integrity on truncated or malformed input. */
auto decode_upsert(std::span<const std::uint8_t> bytes) -> std::expected<Document, core::error>;
auto decode_remove(std::span<const std::uint8_t> bytes) -> std::expected<DocumentId, core::error>;

} // namespace tessera::store
