#include "safcast/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace safcast {

namespace {

constexpr uint64_t kCanonicalQuietNaNBits = 0x7ff8000000000000ull;

double canonicalize(double v) {
  if (std::isnan(v)) return std::bit_cast<double>(kCanonicalQuietNaNBits);
  if (v == 0.0) return 0.0;  // folds -0.0
  return v;
}

} // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
  const auto* p = static_cast<const uint8_t*>(data);
  if (p == nullptr || n == 0) return;

  for (size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

void Fnv1a64::update_string(std::string_view s) {
  update_u64(static_cast<uint64_t>(s.size()));
  if (!s.empty()) update_bytes(s.data(), s.size());
}

void Fnv1a64::update_f64(double x) {
  update_u64(std::bit_cast<uint64_t>(canonicalize(x)));
}

void Fnv1a64::update_f64_array(const double* xs, size_t n) {
  update_u64(static_cast<uint64_t>(n));
  if (xs == nullptr) return;
  for (size_t i = 0; i < n; ++i) update_f64(xs[i]);
}

Hash64 hash_combine(Hash64 a, Hash64 b) {
  uint64_t x = a.value;
  uint64_t y = b.value;

  x ^= y + 0x9e3779b97f4a7c15ull + (x << 6) + (x >> 2);

  x ^= (x >> 33);
  x *= 0xff51afd7ed558ccdull;
  x ^= (x >> 33);
  x *= 0xc4ceb9fe1a85ec53ull;
  x ^= (x >> 33);

  return Hash64{x};
}

std::string hash_to_hex(Hash64 h) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  const uint64_t v = h.value;
  for (int i = 15; i >= 0; --i) {
    out[static_cast<size_t>(15 - i)] = kHex[(v >> (4ull * static_cast<unsigned>(i))) & 0xFull];
  }
  return out;
}

}  // namespace safcast
