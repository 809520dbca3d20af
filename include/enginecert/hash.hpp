#pragma once

#include <string>
#include <string_view>

namespace enginecert {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. The domain is length-framed so that
// ("ab", "c") and ("a", "bc") never collide.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Per-context helpers. These prefixes are part of the fingerprint schema
// contract and covered by FINGERPRINT_ALGORITHM_VERSION.
std::string semantic_file_hash(std::string_view canonical_form);
std::string raw_file_hash(std::string_view raw_bytes);
std::string layer_hash(std::string_view layer_payload);
std::string master_hash(std::string_view master_payload);
std::string receipt_content_hash(std::string_view canonical_receipt);
std::string cas_content_hash(std::string_view raw_bytes);
std::string ledger_record_hash(std::string_view record_line);

// True for a 64-char lowercase hex digest.
bool is_hex_digest(std::string_view d);

}  // namespace enginecert
