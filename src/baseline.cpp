#include "enginecert/baseline.hpp"

#include <filesystem>

#include "enginecert/hash.hpp"
#include "enginecert/jsonlite.hpp"
#include "enginecert/manifest.hpp"
#include "enginecert/util.hpp"
#include "enginecert/version.hpp"

namespace enginecert {

namespace {

jsonlite::Object baseline_body(const Baseline& b) {
  using jsonlite::Value;
  jsonlite::Object o = std::get<jsonlite::Object>(manifest_to_value(b.manifest).v);
  o["baseline_version"] = Value{static_cast<std::uint64_t>(b.format_version)};
  o["created_at"] = Value{b.created_at};
  o["master"] = Value{b.master.hash};
  return o;
}

std::string checksum_of(const jsonlite::Object& body) {
  return hash_domain("baseline:", jsonlite::to_json(jsonlite::Value{body}));
}

BaselineLoadResult invalid(const std::string& detail) {
  BaselineLoadResult r;
  r.error = ErrorCode::baseline_invalid;
  r.detail = detail;
  return r;
}

}  // namespace

Baseline make_baseline(const Manifest& manifest, const MasterFingerprint& master,
                       const std::string& created_at) {
  Baseline b;
  b.format_version = version::BASELINE_FORMAT_VERSION;
  b.created_at = created_at;
  b.manifest = manifest;
  b.master = master;
  return b;
}

std::string baseline_to_json(const Baseline& baseline) {
  jsonlite::Object o = baseline_body(baseline);
  const std::string checksum = checksum_of(o);
  o["baseline_checksum"] = jsonlite::Value{checksum};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

BaselineLoadResult parse_baseline(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object obj = jsonlite::parse(text, &err);
  if (err) return invalid(err->code + ": " + err->message);

  const std::string stored_checksum = jsonlite::get_string(obj, "baseline_checksum");
  if (!is_hex_digest(stored_checksum)) return invalid("baseline_checksum missing");
  jsonlite::Object body = obj;
  body.erase("baseline_checksum");
  if (checksum_of(body) != stored_checksum) return invalid("baseline checksum mismatch");

  const auto format = jsonlite::get_u64(obj, "baseline_version", 0);
  if (format != version::BASELINE_FORMAT_VERSION) {
    return invalid("unsupported baseline_version " + std::to_string(format));
  }

  std::string detail;
  auto manifest = manifest_from_value(body, &detail);
  if (!manifest) return invalid(detail);

  Baseline b;
  b.format_version = static_cast<uint32_t>(format);
  b.created_at = jsonlite::get_string(obj, "created_at");
  b.master.algorithm_version = manifest->algorithm_version;
  b.master.layer_hashes = manifest->layer_hashes;
  b.master.hash = jsonlite::get_string(obj, "master");
  if (!is_hex_digest(b.master.hash)) return invalid("master is not a digest");

  // The master hash can only be recomputed under the algorithm that wrote it.
  if (manifest->algorithm_version == version::algorithm_version_tag() &&
      master_hash_of(manifest->algorithm_version, manifest->layer_hashes) != b.master.hash) {
    return invalid("master does not match layer hashes");
  }
  b.manifest = std::move(*manifest);

  BaselineLoadResult r;
  r.baseline = std::move(b);
  return r;
}

BaselineStore::BaselineStore(std::string path) : path_(std::move(path)) {}

bool BaselineStore::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

bool BaselineStore::save(const Baseline& baseline, std::string* error) const {
  if (!atomic_write(path_, baseline_to_json(baseline) + "\n")) {
    if (error) *error = "cannot write baseline " + path_;
    return false;
  }
  return true;
}

BaselineLoadResult BaselineStore::load() const {
  auto text = read_file(path_);
  if (!text) {
    BaselineLoadResult r;
    r.error = ErrorCode::io_error;
    r.detail = "cannot read baseline " + path_;
    return r;
  }
  while (!text->empty() && (text->back() == '\n' || text->back() == '\r')) text->pop_back();
  return parse_baseline(*text);
}

}  // namespace enginecert
