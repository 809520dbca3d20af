#include "enginecert/config.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <set>

#include "enginecert/jsonlite.hpp"
#include "enginecert/util.hpp"

namespace fs = std::filesystem;

namespace enginecert {

namespace {

using jsonlite::Object;
using jsonlite::Value;

constexpr std::uint64_t kMaxWorkers = 1024;
constexpr std::uint64_t kMaxAnchorAttempts = 100;
constexpr std::uint64_t kMaxMillis = 24ull * 60 * 60 * 1000;

ConfigLoadResult invalid(const std::string& detail) {
  ConfigLoadResult r;
  r.error = ErrorCode::config_invalid;
  r.detail = detail;
  return r;
}

std::string resolve(const std::string& base_dir, const std::string& p) {
  if (base_dir.empty() || p.empty() || fs::path(p).is_absolute()) return p;
  return (fs::path(base_dir) / p).lexically_normal().string();
}

bool parse_uint(const char* s, uint64_t* out) {
  const char* end = s + std::char_traits<char>::length(s);
  auto [ptr, ec] = std::from_chars(s, end, *out);
  return ec == std::errc() && ptr == end && ptr != s;
}

// A field that is present must have the expected JSON type; an absent one
// leaves *out at its default.
template <typename T>
bool read_field(const Object& o, const std::string& key, const char* type_name, T* out,
                std::string* error) {
  const Value* v = jsonlite::find(o, key);
  if (!v) return true;
  if (!std::holds_alternative<T>(v->v)) {
    *error = "'" + key + "' must be " + type_name;
    return false;
  }
  *out = std::get<T>(v->v);
  return true;
}

bool read_ms(const Object& o, const std::string& key, std::chrono::milliseconds* out,
             std::string* error) {
  std::uint64_t ms = static_cast<std::uint64_t>(out->count());
  if (!read_field(o, key, "a non-negative integer", &ms, error)) return false;
  if (ms > kMaxMillis) {
    *error = "'" + key + "' must be at most " + std::to_string(kMaxMillis);
    return false;
  }
  *out = std::chrono::milliseconds(ms);
  return true;
}

bool only_keys(const Object& o, const std::set<std::string>& known, const std::string& where,
               std::string* error) {
  for (const auto& [k, v] : o) {
    (void)v;
    if (!known.count(k)) {
      *error = "unknown " + where + " field '" + k + "'";
      return false;
    }
  }
  return true;
}

bool parse_member(const Value& v, LayerMember* m, std::string* error) {
  if (std::holds_alternative<std::string>(v.v)) {
    m->path = std::get<std::string>(v.v);
    return true;
  }
  if (!std::holds_alternative<Object>(v.v)) {
    *error = "layer member must be a path or an object";
    return false;
  }
  const auto& o = std::get<Object>(v.v);
  if (!only_keys(o, {"path", "critical", "kind"}, "layer member", error)) return false;
  if (!jsonlite::find(o, "path")) {
    *error = "layer member has no path";
    return false;
  }
  std::string kind;
  if (!read_field(o, "path", "a string", &m->path, error) ||
      !read_field(o, "critical", "true or false", &m->critical, error) ||
      !read_field(o, "kind", "a string", &kind, error)) {
    if (!m->path.empty()) *error += " (member '" + m->path + "')";
    return false;
  }
  if (jsonlite::find(o, "kind")) {
    auto k = file_kind_from_string(kind);
    if (!k) {
      *error = "unknown file kind '" + kind + "'";
      return false;
    }
    m->kind = *k;
  }
  return true;
}

}  // namespace

bool validate_layer_config(const LayerConfig& layers, std::string* error) {
  if (layers.layers.empty()) {
    *error = "no layers configured";
    return false;
  }
  std::map<std::string, FileKind> explicit_kinds;
  for (const auto& [name, spec] : layers.layers) {
    if (!is_valid_problem_class(name) || name != spec.name) {
      *error = "invalid layer name '" + name + "'";
      return false;
    }
    if (spec.members.empty()) {
      *error = "layer '" + name + "' has no members";
      return false;
    }
    std::set<std::string> seen;
    for (const auto& m : spec.members) {
      if (!is_canonical_relative_path(m.path)) {
        *error = "path '" + m.path + "' in layer '" + name + "' is not a canonical relative path";
        return false;
      }
      if (!seen.insert(m.path).second) {
        *error = "duplicate member '" + m.path + "' in layer '" + name + "'";
        return false;
      }
      if (m.kind) {
        auto [it, inserted] = explicit_kinds.emplace(m.path, *m.kind);
        if (!inserted && it->second != *m.kind) {
          *error = "conflicting kinds for '" + m.path + "'";
          return false;
        }
      }
    }
  }
  // A path declared with an explicit kind in one layer and detected in
  // another must still normalise one way.
  for (const auto& [name, spec] : layers.layers) {
    for (const auto& m : spec.members) {
      auto it = explicit_kinds.find(m.path);
      if (!m.kind && it != explicit_kinds.end() && it->second != detect_file_kind(m.path)) {
        *error = "conflicting kinds for '" + m.path + "'";
        return false;
      }
    }
  }
  return true;
}

ConfigLoadResult parse_config(const std::string& json, const std::string& base_dir) {
  std::optional<jsonlite::JsonError> err;
  const Object root = jsonlite::parse(json, &err);
  if (err) return invalid(err->code + ": " + err->message);

  static const std::set<std::string> kKnown = {"engine",   "source_root",  "layers",
                                               "anchor",   "workers",      "baseline",
                                               "evidence_dir", "evidence_compression", "ledger"};
  for (const auto& [k, v] : root) {
    (void)v;
    if (!kKnown.count(k)) return invalid("unknown config field '" + k + "'");
  }

  CertConfig c;
  std::string detail;
  Object engine;
  if (!read_field(root, "engine", "an object", &engine, &detail) ||
      !only_keys(engine, {"name", "version"}, "engine", &detail) ||
      !read_field(engine, "name", "a string", &c.engine.name, &detail) ||
      !read_field(engine, "version", "a string", &c.engine.version, &detail)) {
    return invalid(detail);
  }
  if (c.engine.name.empty() || c.engine.version.empty()) return invalid("engine name and version are required");

  std::uint64_t workers = 0;
  if (!read_field(root, "source_root", "a string", &c.source_root, &detail) ||
      !read_field(root, "baseline", "a string", &c.baseline_path, &detail) ||
      !read_field(root, "evidence_dir", "a string", &c.evidence_dir, &detail) ||
      !read_field(root, "ledger", "a string", &c.ledger_path, &detail) ||
      !read_field(root, "evidence_compression", "a string", &c.evidence_compression, &detail) ||
      !read_field(root, "workers", "a non-negative integer", &workers, &detail)) {
    return invalid(detail);
  }
  c.source_root = resolve(base_dir, c.source_root);
  c.baseline_path = resolve(base_dir, c.baseline_path);
  c.evidence_dir = resolve(base_dir, c.evidence_dir);
  c.ledger_path = resolve(base_dir, c.ledger_path);
  if (c.evidence_compression != "off" && c.evidence_compression != "zstd") {
    return invalid("evidence_compression must be \"off\" or \"zstd\"");
  }
  if (workers > kMaxWorkers) return invalid("workers must be at most " + std::to_string(kMaxWorkers));
  c.workers = static_cast<unsigned>(workers);

  Object anchor;
  std::uint64_t max_attempts = c.anchor.max_attempts;
  std::uint64_t max_in_flight = c.anchor.max_in_flight;
  if (!read_field(root, "anchor", "an object", &anchor, &detail) ||
      !only_keys(anchor, {"timeout_ms", "max_attempts", "initial_backoff_ms", "max_backoff_ms", "max_in_flight"},
                 "anchor", &detail) ||
      !read_ms(anchor, "timeout_ms", &c.anchor.attempt_timeout, &detail) ||
      !read_field(anchor, "max_attempts", "a non-negative integer", &max_attempts, &detail) ||
      !read_ms(anchor, "initial_backoff_ms", &c.anchor.initial_backoff, &detail) ||
      !read_ms(anchor, "max_backoff_ms", &c.anchor.max_backoff, &detail) ||
      !read_field(anchor, "max_in_flight", "a non-negative integer", &max_in_flight, &detail)) {
    return invalid(detail);
  }
  if (max_in_flight == 0 || max_in_flight > kMaxAnchorAttempts) {
    return invalid("anchor max_in_flight must be between 1 and " + std::to_string(kMaxAnchorAttempts));
  }
  c.anchor.max_in_flight = static_cast<uint32_t>(max_in_flight);
  if (max_attempts == 0 || max_attempts > kMaxAnchorAttempts || c.anchor.attempt_timeout.count() == 0) {
    return invalid("anchor timeout_ms and max_attempts must be positive");
  }
  c.anchor.max_attempts = static_cast<uint32_t>(max_attempts);

  const Value* layers = jsonlite::find(root, "layers");
  if (!layers || !std::holds_alternative<Object>(layers->v)) return invalid("layers must be an object");
  for (const auto& [name, members] : std::get<Object>(layers->v)) {
    if (!std::holds_alternative<jsonlite::Array>(members.v)) {
      return invalid("layer '" + name + "' must be an array of members");
    }
    LayerSpec spec;
    spec.name = name;
    for (const auto& mv : std::get<jsonlite::Array>(members.v)) {
      LayerMember m;
      if (!parse_member(mv, &m, &detail)) return invalid(detail);
      spec.members.push_back(std::move(m));
    }
    c.layers.layers[name] = std::move(spec);
  }
  if (!validate_layer_config(c.layers, &detail)) return invalid(detail);

  ConfigLoadResult r;
  r.config = std::move(c);
  return r;
}

bool apply_env_overrides(CertConfig& config, std::string* error) {
  if (const char* e = std::getenv("ENGINECERT_BASELINE"); e && e[0]) config.baseline_path = e;
  if (const char* e = std::getenv("ENGINECERT_EVIDENCE_DIR"); e && e[0]) config.evidence_dir = e;
  if (const char* e = std::getenv("ENGINECERT_LEDGER"); e && e[0]) config.ledger_path = e;

  uint64_t n = 0;
  if (const char* e = std::getenv("ENGINECERT_WORKERS"); e && e[0]) {
    if (!parse_uint(e, &n)) {
      *error = "ENGINECERT_WORKERS is not a number";
      return false;
    }
    config.workers = static_cast<unsigned>(n);
  }
  if (const char* e = std::getenv("ENGINECERT_ANCHOR_TIMEOUT_MS"); e && e[0]) {
    if (!parse_uint(e, &n) || n == 0) {
      *error = "ENGINECERT_ANCHOR_TIMEOUT_MS must be a positive number";
      return false;
    }
    config.anchor.attempt_timeout = std::chrono::milliseconds(n);
  }
  if (const char* e = std::getenv("ENGINECERT_ANCHOR_MAX_ATTEMPTS"); e && e[0]) {
    if (!parse_uint(e, &n) || n == 0) {
      *error = "ENGINECERT_ANCHOR_MAX_ATTEMPTS must be a positive number";
      return false;
    }
    config.anchor.max_attempts = static_cast<uint32_t>(n);
  }
  return true;
}

ConfigLoadResult load_config(const std::string& path) {
  auto text = read_file(path);
  if (!text) {
    ConfigLoadResult r;
    r.error = ErrorCode::io_error;
    r.detail = "cannot read config " + path;
    return r;
  }
  auto r = parse_config(*text, fs::path(path).parent_path().string());
  if (!r.config) return r;
  std::string detail;
  if (!apply_env_overrides(*r.config, &detail)) return invalid(detail);
  return r;
}

}  // namespace enginecert
