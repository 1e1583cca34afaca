#include "tessera/store/record_codec.hpp"

#include <cstring>
#include <type_traits>
#include <variant>
#include <string>

namespace tessera::store {

namespace {

constexpr std::uint32_t kMaxDepth = 64;

enum class Tag : std::uint8_t { null = 0, boolean = 1, int64 = 2, float64 = 3, string = 4, array = 5, object = 6 };

class Writer {
public:
  auto u8(std::uint8_t v) -> void { out_.push_back(v); }
  auto u32(std::uint32_t v) -> void { raw(&v, 4); }
  auto u64(std::uint64_t v) -> void { raw(&v, 8); }
  auto f64(double v) -> void { raw(&v, 8); }
  auto str(const std::string& s) -> void {
    u32(static_cast<std::uint32_t>(s.size()));
    raw(s.data(), s.size());
  }
  auto raw(const void* p, std::size_t n) -> void {
    const auto* b = static_cast<const std::uint8_t*>(p);
    out_.insert(out_.end(), b, b + n);
  }
  auto take() -> std::vector<std::uint8_t> { return std::move(out_); }

private:
  std::vector<std::uint8_t> out_;
};

class Reader {
public:
  explicit Reader(std::span<const std::uint8_t> in) : in_(in) {}

  auto u8(std::uint8_t& v) -> bool { return raw(&v, 1); }
  auto u32(std::uint32_t& v) -> bool { return raw(&v, 4); }
  auto u64(std::uint64_t& v) -> bool { return raw(&v, 8); }
  auto f64(double& v) -> bool { return raw(&v, 8); }
  auto str(std::string& s) -> bool {
    std::uint32_t n = 0;
    if (!u32(n) || n > remaining()) return false;
    s.assign(reinterpret_cast<const char*>(in_.data() + pos_), n);
    pos_ += n;
    return true;
  }
  auto raw(void* p, std::size_t n) -> bool {
    if (n > remaining()) return false;
    std::memcpy(p, in_.data() + pos_, n);
    pos_ += n;
    return true;
  }
  auto remaining() const noexcept -> std::size_t { return in_.size() - pos_; }

private:
  std::span<const std::uint8_t> in_;
  std::size_t pos_{0};
};

auto corrupt(const char* what) -> std::unexpected<core::error> {
  return core::fail(core::error_code::data_integrity, what, "store.codec");
}

auto write_id(Writer& w, const DocumentId& id) -> void {
  if (const auto* n = std::get_if<std::uint64_t>(&id)) {
    w.u8(0);
    w.u64(*n);
  } else {
    w.u8(1);
    w.str(std::get<std::string>(id));
  }
}

auto read_id(Reader& r) -> std::expected<DocumentId, core::error> {
  std::uint8_t tag = 0;
  if (!r.u8(tag)) return corrupt("truncated id");
  if (tag == 0) {
    std::uint64_t n = 0;
    if (!r.u64(n)) return corrupt("truncated id");
    return DocumentId{n};
  }
  if (tag == 1) {
    std::string s;
    if (!r.str(s)) return corrupt("truncated id");
    return DocumentId{std::move(s)};
  }
  return corrupt("unknown id tag");
}

auto write_value(Writer& w, const PayloadValue& v) -> void {
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      w.u8(static_cast<std::uint8_t>(Tag::null));
    } else if constexpr (std::is_same_v<T, bool>) {
      w.u8(static_cast<std::uint8_t>(Tag::boolean));
      w.u8(x ? 1 : 0);
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
      w.u8(static_cast<std::uint8_t>(Tag::int64));
      w.u64(static_cast<std::uint64_t>(x));
    } else if constexpr (std::is_same_v<T, double>) {
      w.u8(static_cast<std::uint8_t>(Tag::float64));
      w.f64(x);
    } else if constexpr (std::is_same_v<T, std::string>) {
      w.u8(static_cast<std::uint8_t>(Tag::string));
      w.str(x);
    } else if constexpr (std::is_same_v<T, PayloadValue::Array>) {
      w.u8(static_cast<std::uint8_t>(Tag::array));
      w.u32(static_cast<std::uint32_t>(x.size()));
      for (const auto& e : x) write_value(w, e);
    } else {
      w.u8(static_cast<std::uint8_t>(Tag::object));
      w.u32(static_cast<std::uint32_t>(x.size()));
      for (const auto& [k, e] : x) {
        w.str(k);
        write_value(w, e);
      }
    }
  }, v.value);
}

auto read_value(Reader& r, std::uint32_t depth) -> std::expected<PayloadValue, core::error> {
  if (depth > kMaxDepth) return corrupt("payload nesting too deep");
  std::uint8_t tag = 0;
  if (!r.u8(tag)) return corrupt("truncated payload");
  switch (static_cast<Tag>(tag)) {
    case Tag::null: return PayloadValue{};
    case Tag::boolean: {
      std::uint8_t b = 0;
      if (!r.u8(b)) return corrupt("truncated bool");
      return PayloadValue{b != 0};
    }
    case Tag::int64: {
      std::uint64_t n = 0;
      if (!r.u64(n)) return corrupt("truncated int");
      return PayloadValue{static_cast<std::int64_t>(n)};
    }
    case Tag::float64: {
      double d = 0;
      if (!r.f64(d)) return corrupt("truncated float");
      return PayloadValue{d};
    }
    case Tag::string: {
      std::string s;
      if (!r.str(s)) return corrupt("truncated string");
      return PayloadValue{std::move(s)};
    }
    case Tag::array: {
      std::uint32_t n = 0;
      if (!r.u32(n) || n > r.remaining()) return corrupt("truncated array");
      PayloadValue::Array a;
      a.reserve(n);
      for (std::uint32_t i = 0; i < n; ++i) {
        auto e = read_value(r, depth + 1);
        if (!e) return std::unexpected(e.error());
        a.push_back(std::move(*e));
      }
      return PayloadValue{std::move(a)};
    }
    case Tag::object: {
      auto o = [&]() -> std::expected<PayloadValue::Object, core::error> {
        std::uint32_t n = 0;
        if (!r.u32(n) || n > r.remaining()) return corrupt("truncated object");
        PayloadValue::Object obj;
        for (std::uint32_t i = 0; i < n; ++i) {
          std::string key;
          if (!r.str(key)) return corrupt("truncated key");
          auto e = read_value(r, depth + 1);
          if (!e) return std::unexpected(e.error());
          obj.insert_or_assign(std::move(key), std::move(*e));
        }
        return obj;
      }();
      if (!o) return std::unexpected(o.error());
      return PayloadValue{std::move(*o)};
    }
  }
  return corrupt("unknown payload tag");
}

} // namespace

auto encode_upsert(const Document& doc) -> std::vector<std::uint8_t> {
  Writer w;
  write_id(w, doc.id);
  w.u32(static_cast<std::uint32_t>(doc.vector.size()));
  w.raw(doc.vector.data(), doc.vector.size() * sizeof(float));
  write_value(w, PayloadValue{doc.payload});
  return w.take();
}

auto encode_remove(const DocumentId& id) -> std::vector<std::uint8_t> {
  Writer w;
  write_id(w, id);
  return w.take();
}

auto decode_upsert(std::span<const std::uint8_t> bytes) -> std::expected<Document, core::error> {
  Reader r(bytes);
  Document doc;
  auto id = read_id(r);
  if (!id) return std::unexpected(id.error());
  doc.id = std::move(*id);

  std::uint32_t dim = 0;
  if (!r.u32(dim) || static_cast<std::size_t>(dim) * sizeof(float) > r.remaining()) {
    return corrupt("truncated vector");
  }
  doc.vector.resize(dim);
  if (!r.raw(doc.vector.data(), dim * sizeof(float))) return corrupt("truncated vector");

  auto payload = read_value(r, 0);
  if (!payload) return std::unexpected(payload.error());
  const auto* obj = payload->as_object();
  if (obj == nullptr) return corrupt("payload is not an object");
  doc.payload = *obj;
  if (r.remaining() != 0) return corrupt("trailing bytes in upsert record");
  return doc;
}

auto decode_remove(std::span<const std::uint8_t> bytes) -> std::expected<DocumentId, core::error> {
  Reader r(bytes);
  auto id = read_id(r);
  if (!id) return id;
  if (r.remaining() != 0) return corrupt("trailing bytes in remove record");
  return id;
}

} // namespace tessera::store
