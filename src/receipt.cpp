#include "enginecert/receipt.hpp"

#include <algorithm>
#include <set>

#include "enginecert/hash.hpp"
#include "enginecert/jsonlite.hpp"
#include "enginecert/util.hpp"
#include "enginecert/version.hpp"

namespace enginecert {

namespace {

using jsonlite::Object;
using jsonlite::Value;

constexpr std::size_t kMaxFieldBytes = 128;

bool is_printable_field(const std::string& s) {
  if (s.empty() || s.size() > kMaxFieldBytes) return false;
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return static_cast<unsigned char>(c) >= 0x20 && c != 0x7f; });
}

Object canonical_object(const CertificationReceipt& r) {
  Object engine;
  engine["name"] = Value{r.engine.name};
  engine["version"] = Value{r.engine.version};

  Object integrity;
  integrity["algorithm_version"] = Value{r.algorithm_version};
  integrity["master_fingerprint"] = Value{r.master_fingerprint};
  integrity["raw_fallback_files"] = Value{static_cast<std::uint64_t>(r.raw_fallback_files)};

  Object validation;
  for (const auto& [k, passed] : r.validation) validation[k] = Value{passed};

  Object o;
  o["engine"] = Value{std::move(engine)};
  o["integrity"] = Value{std::move(integrity)};
  o["schema_version"] = Value{static_cast<std::uint64_t>(r.schema_version)};
  o["timestamp"] = Value{r.timestamp};
  o["validation"] = Value{std::move(validation)};
  return o;
}

// Every key of obj must be in allowed, and every key in required present.
bool keys_exactly(const Object& obj, const std::set<std::string>& allowed,
                  const std::set<std::string>& required, std::string* error,
                  const std::string& where) {
  for (const auto& [k, v] : obj) {
    (void)v;
    if (!allowed.count(k)) {
      *error = "unexpected field '" + k + "' in " + where;
      return false;
    }
  }
  for (const auto& k : required) {
    if (!obj.count(k)) {
      *error = "missing field '" + k + "' in " + where;
      return false;
    }
  }
  return true;
}

const std::string* as_string(const Object& obj, const std::string& key) {
  const Value* v = jsonlite::find(obj, key);
  if (!v || !std::holds_alternative<std::string>(v->v)) return nullptr;
  return &std::get<std::string>(v->v);
}

const Object* as_object(const Object& obj, const std::string& key) {
  const Value* v = jsonlite::find(obj, key);
  if (!v || !std::holds_alternative<Object>(v->v)) return nullptr;
  return &std::get<Object>(v->v);
}

const std::uint64_t* as_u64(const Object& obj, const std::string& key) {
  const Value* v = jsonlite::find(obj, key);
  if (!v || !std::holds_alternative<std::uint64_t>(v->v)) return nullptr;
  return &std::get<std::uint64_t>(v->v);
}

std::optional<std::string> field_error(const CertificationReceipt& r) {
  if (r.schema_version != version::RECEIPT_SCHEMA_VERSION) {
    return "unsupported schema_version " + std::to_string(r.schema_version);
  }
  if (!is_printable_field(r.engine.name)) return std::string("engine name is empty or malformed");
  if (!is_printable_field(r.engine.version)) return std::string("engine version is empty or malformed");
  if (r.validation.empty()) return std::string("validation results are empty");
  for (const auto& [k, v] : r.validation) {
    (void)v;
    if (!is_valid_problem_class(k)) return "invalid problem class '" + k + "'";
  }
  if (!is_hex_digest(r.master_fingerprint)) return std::string("master_fingerprint is not a digest");
  if (!is_printable_field(r.algorithm_version)) return std::string("algorithm_version is empty");
  if (!is_utc_timestamp(r.timestamp)) return "timestamp '" + r.timestamp + "' is not UTC ISO-8601";
  return std::nullopt;
}

}  // namespace

bool CertificationReceipt::validation_passed() const {
  return !validation.empty() &&
         std::all_of(validation.begin(), validation.end(), [](const auto& kv) { return kv.second; });
}

std::string canonical_serialize(const CertificationReceipt& receipt) {
  return jsonlite::to_json(Value{canonical_object(receipt)});
}

std::string compute_content_hash(const CertificationReceipt& receipt) {
  return receipt_content_hash(canonical_serialize(receipt));
}

bool verify_self_consistency(const CertificationReceipt& receipt) {
  return is_hex_digest(receipt.content_hash) && compute_content_hash(receipt) == receipt.content_hash;
}

std::string receipt_to_json(const CertificationReceipt& receipt) {
  Object o = canonical_object(receipt);
  o["content_hash"] = Value{receipt.content_hash};
  return jsonlite::to_json(Value{std::move(o)});
}

bool is_valid_problem_class(const std::string& key) {
  if (key.empty() || key.size() > kMaxFieldBytes) return false;
  return std::all_of(key.begin(), key.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '.' || c == '-';
  });
}

ReceiptParseResult parse_receipt(const std::string& json) {
  ReceiptParseResult out;
  std::optional<jsonlite::JsonError> err;
  const Object obj = jsonlite::parse(json, &err);
  if (err) {
    out.error = err->code + ": " + err->message;
    return out;
  }
  static const std::set<std::string> kTop = {"content_hash", "engine",    "integrity",
                                             "schema_version", "timestamp", "validation"};
  if (!keys_exactly(obj, kTop, kTop, &out.error, "receipt")) return out;

  CertificationReceipt r;
  const auto* schema = as_u64(obj, "schema_version");
  const auto* ts = as_string(obj, "timestamp");
  const auto* ch = as_string(obj, "content_hash");
  const auto* engine = as_object(obj, "engine");
  const auto* integrity = as_object(obj, "integrity");
  const auto* validation = as_object(obj, "validation");
  if (!schema || !ts || !ch || !engine || !integrity || !validation) {
    out.error = "receipt field has the wrong type";
    return out;
  }

  static const std::set<std::string> kEngine = {"name", "version"};
  if (!keys_exactly(*engine, kEngine, kEngine, &out.error, "engine")) return out;
  static const std::set<std::string> kIntegrity = {"algorithm_version", "master_fingerprint",
                                                   "raw_fallback_files"};
  if (!keys_exactly(*integrity, kIntegrity, kIntegrity, &out.error, "integrity")) return out;

  const auto* name = as_string(*engine, "name");
  const auto* ver = as_string(*engine, "version");
  const auto* algo = as_string(*integrity, "algorithm_version");
  const auto* master = as_string(*integrity, "master_fingerprint");
  const auto* fallbacks = as_u64(*integrity, "raw_fallback_files");
  if (!name || !ver || !algo || !master || !fallbacks || *fallbacks > UINT32_MAX ||
      *schema > UINT32_MAX) {
    out.error = "receipt field has the wrong type";
    return out;
  }

  r.schema_version = static_cast<uint32_t>(*schema);
  r.engine = EngineIdentity{*name, *ver};
  r.algorithm_version = *algo;
  r.master_fingerprint = *master;
  r.raw_fallback_files = static_cast<uint32_t>(*fallbacks);
  r.timestamp = *ts;
  r.content_hash = *ch;
  for (const auto& [k, v] : *validation) {
    if (!std::holds_alternative<bool>(v.v)) {
      out.error = "validation entry '" + k + "' is not a boolean";
      return out;
    }
    r.validation[k] = std::get<bool>(v.v);
  }

  if (auto fe = field_error(r)) {
    out.error = *fe;
    return out;
  }
  if (!is_hex_digest(r.content_hash)) {
    out.error = "content_hash is not a digest";
    return out;
  }
  out.receipt = std::move(r);
  return out;
}

// ---------------------------------------------------------------------------
// ReceiptBuilder
// ---------------------------------------------------------------------------

ReceiptBuilder& ReceiptBuilder::set_engine(const EngineIdentity& engine) {
  r_.engine = engine;
  return *this;
}

ReceiptBuilder& ReceiptBuilder::set_validation(const ValidationResults& results) {
  r_.validation = results;
  return *this;
}

ReceiptBuilder& ReceiptBuilder::set_master_fingerprint(const MasterFingerprint& master,
                                                       uint32_t raw_fallback_files) {
  r_.master_fingerprint = master.hash;
  r_.algorithm_version = master.algorithm_version;
  r_.raw_fallback_files = raw_fallback_files;
  return *this;
}

ReceiptBuilder& ReceiptBuilder::set_timestamp(const std::string& utc_iso8601) {
  r_.timestamp = utc_iso8601;
  return *this;
}

ReceiptBuildResult ReceiptBuilder::build() const {
  ReceiptBuildResult out;
  CertificationReceipt r = r_;
  r.schema_version = version::RECEIPT_SCHEMA_VERSION;
  if (auto fe = field_error(r)) {
    out.error = ErrorCode::receipt_invalid;
    out.detail = *fe;
    return out;
  }
  r.content_hash = compute_content_hash(r);
  out.receipt = std::move(r);
  return out;
}

// ---------------------------------------------------------------------------
// Validation results input
// ---------------------------------------------------------------------------

ValidationLoadResult parse_validation_results(const std::string& json) {
  ValidationLoadResult out;
  std::optional<jsonlite::JsonError> err;
  const Value root = jsonlite::parse_value(json, &err);
  if (err) {
    out.code = ErrorCode::parse_error;
    out.error = err->code + ": " + err->message;
    return out;
  }
  // Every later failure is a content problem.
  out.code = ErrorCode::receipt_invalid;

  auto add = [&out](const std::string& key, bool passed) {
    if (!is_valid_problem_class(key)) {
      out.error = "invalid problem class '" + key + "'";
      return false;
    }
    if (!out.results.emplace(key, passed).second) {
      out.error = "duplicate problem class '" + key + "'";
      return false;
    }
    return true;
  };

  if (std::holds_alternative<Object>(root.v)) {
    for (const auto& [k, v] : std::get<Object>(root.v)) {
      if (!std::holds_alternative<bool>(v.v)) {
        out.error = "result for '" + k + "' is not a boolean";
        return out;
      }
      if (!add(k, std::get<bool>(v.v))) return out;
    }
  } else if (std::holds_alternative<jsonlite::Array>(root.v)) {
    for (const auto& item : std::get<jsonlite::Array>(root.v)) {
      if (!std::holds_alternative<Object>(item.v)) {
        out.error = "claim entry is not an object";
        return out;
      }
      const auto& claim = std::get<Object>(item.v);
      const auto* id = as_string(claim, "claim_id");
      const Value* verdict = jsonlite::find(claim, "verified");
      if (!id || !verdict) {
        out.error = "claim entry needs claim_id and verified";
        return out;
      }
      if (std::holds_alternative<std::nullptr_t>(verdict->v)) {
        out.warnings.push_back(Warning{"validation_skipped", *id});
        continue;
      }
      if (!std::holds_alternative<bool>(verdict->v)) {
        out.error = "verified for '" + *id + "' is not a boolean or null";
        return out;
      }
      if (!add(*id, std::get<bool>(verdict->v))) return out;
    }
  } else {
    out.error = "validation results must be an object or an array";
    return out;
  }
  out.ok = true;
  out.code = ErrorCode::none;
  return out;
}

}  // namespace enginecert
