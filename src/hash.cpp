#include "enginecert/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "file:sem:", "file:raw:", "layer:", "master:",
//      "rcpt:", "cas:" and "ledger:" prefixes keep a file hash from ever
//      being accepted as a layer, master or receipt hash.
//   3. The domain is fed with an 8-byte little-endian length in front of it.
//      Changing the framing requires a FINGERPRINT_ALGORITHM_VERSION bump.

#include <array>
#include <cstdint>

extern "C" {
#include <blake3.h>
}

namespace enginecert {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

void update_length(blake3_hasher& hasher, std::uint64_t len) {
  unsigned char buf[8];
  for (int i = 0; i < 8; ++i) buf[i] = static_cast<unsigned char>((len >> (8 * i)) & 0xff);
  blake3_hasher_update(&hasher, buf, sizeof(buf));
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "system";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  update_length(hasher, domain.size());
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string semantic_file_hash(std::string_view canonical_form) {
  return hash_domain("file:sem:", canonical_form);
}

std::string raw_file_hash(std::string_view raw_bytes) {
  return hash_domain("file:raw:", raw_bytes);
}

std::string layer_hash(std::string_view layer_payload) {
  return hash_domain("layer:", layer_payload);
}

std::string master_hash(std::string_view master_payload) {
  return hash_domain("master:", master_payload);
}

std::string receipt_content_hash(std::string_view canonical_receipt) {
  return hash_domain("rcpt:", canonical_receipt);
}

std::string cas_content_hash(std::string_view raw_bytes) {
  return hash_domain("cas:", raw_bytes);
}

std::string ledger_record_hash(std::string_view record_line) {
  return hash_domain("ledger:", record_line);
}

bool is_hex_digest(std::string_view d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace enginecert
