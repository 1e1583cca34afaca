#include "tessera/error.hpp"

namespace tessera::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::already_exists: return "already_exists";
    case error_code::invalid_schema: return "invalid_schema";
    case error_code::schema_mismatch: return "schema_mismatch";
    case error_code::invalid_query: return "invalid_query";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
  }
  return "unknown";
}

auto describe(const error& e) -> std::string {
  std::string out;
  out.reserve(e.component.size() + e.message.size() + 24);
  out += e.component.empty() ? std::string_view{"tessera"} : std::string_view{e.component};
  out += ": ";
  out += to_string(e.code);
  out += ": ";
  out += e.message;
  return out;
}

} // namespace tessera::core
