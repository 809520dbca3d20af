#include "enginecert/manifest.hpp"

#include <algorithm>

#include "enginecert/hash.hpp"
#include "enginecert/observability.hpp"
#include "enginecert/version.hpp"

namespace enginecert {

namespace {

void append_framed(std::string& out, const std::string& s) {
  out += std::to_string(s.size());
  out += ':';
  out += s;
}

void fail(std::string* error, const std::string& detail) {
  if (error) *error = detail;
}

}  // namespace

std::string compute_layer_hash(const std::string& layer,
                               std::vector<const FileFingerprint*> members) {
  std::sort(members.begin(), members.end(),
            [](const FileFingerprint* a, const FileFingerprint* b) { return a->path < b->path; });
  std::string payload;
  append_framed(payload, layer);
  payload += '\n';
  for (const FileFingerprint* fp : members) {
    append_framed(payload, fp->path);
    payload += '=';
    payload += fp->hash;
    payload += ':';
    payload += to_string(fp->mode);
    payload += '\n';
  }
  return layer_hash(payload);
}

std::string master_hash_of(const std::string& algorithm_version,
                           const std::map<std::string, std::string>& layer_hashes) {
  std::string payload;
  append_framed(payload, algorithm_version);
  payload += '\n';
  for (const auto& [name, hash] : layer_hashes) {  // std::map: sorted by name
    append_framed(payload, name);
    payload += '=';
    payload += hash;
    payload += '\n';
  }
  return master_hash(payload);
}

MasterFingerprint compute_master_fingerprint(const Manifest& manifest) {
  MasterFingerprint m;
  m.algorithm_version = manifest.algorithm_version;
  m.layer_hashes = manifest.layer_hashes;
  m.hash = master_hash_of(manifest.algorithm_version, manifest.layer_hashes);
  return m;
}

ManifestBuildResult assemble_manifest(const LayerConfig& config,
                                      const std::vector<FileFingerprint>& fingerprints,
                                      const std::vector<MissingFile>& absent) {
  ManifestBuildResult r;
  for (const auto& m : absent) {
    if (m.critical) r.missing_critical.push_back(m);
  }
  if (!r.missing_critical.empty()) {
    r.error = ErrorCode::missing_critical_file;
    for (const auto& m : r.missing_critical) {
      if (!r.error_detail.empty()) r.error_detail += ", ";
      r.error_detail += m.layer + "/" + m.path;
    }
    return r;
  }

  std::map<std::string, const FileFingerprint*> by_path;
  for (const auto& fp : fingerprints) by_path[fp.path] = &fp;

  Manifest& mf = r.manifest;
  mf.algorithm_version = version::algorithm_version_tag();
  for (const auto& [layer_name, spec] : config.layers) {
    std::vector<const FileFingerprint*> members;
    std::vector<std::string> paths;
    for (const auto& m : spec.members) {
      auto it = by_path.find(m.path);
      if (it == by_path.end()) continue;  // absent, handled below
      members.push_back(it->second);
      paths.push_back(m.path);
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    mf.layer_hashes[layer_name] = compute_layer_hash(layer_name, members);
    mf.layer_members[layer_name] = std::move(paths);
  }
  for (const auto& fp : fingerprints) {
    mf.fingerprints[fp.path] = fp;
    if (fp.mode == FingerprintMode::raw_fallback) {
      r.warnings.push_back(Warning{"raw_fallback", fp.path + ": " + fp.fallback_reason});
    }
  }
  for (const auto& m : absent) {
    mf.missing.push_back(m);
    r.warnings.push_back(Warning{"missing_optional_file", m.layer + "/" + m.path});
  }
  r.ok = true;
  return r;
}

ManifestBuildResult build_manifest(const LayerConfig& config,
                                   const std::vector<FileFingerprint>& fingerprints,
                                   const std::vector<MissingFile>& absent) {
  ManifestBuildResult r;
  uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    r = assemble_manifest(config, fingerprints, absent);
  }
  if (r.ok) global_engine_stats().manifests_built.fetch_add(1, std::memory_order_relaxed);

  PipelineEvent ev;
  ev.event = "manifest";
  ev.stage = to_string(PipelineStage::manifested);
  ev.ok = r.ok;
  ev.duration_ns = duration_ns;
  if (!r.ok) {
    ev.error_code = to_string(r.error);
    ev.detail = r.error_detail;
  } else {
    ev.fields["layers"] = std::to_string(r.manifest.layer_hashes.size());
    ev.fields["files"] = std::to_string(r.manifest.fingerprints.size());
  }
  emit_event(ev);
  return r;
}

jsonlite::Value manifest_to_value(const Manifest& manifest) {
  using jsonlite::Array;
  using jsonlite::Object;
  using jsonlite::Value;

  Object layer_hashes;
  for (const auto& [name, hash] : manifest.layer_hashes) layer_hashes[name] = Value{hash};

  Object layer_members;
  for (const auto& [name, paths] : manifest.layer_members) {
    Array arr;
    for (const auto& p : paths) arr.push_back(Value{p});
    layer_members[name] = Value{std::move(arr)};
  }

  Object files;
  for (const auto& [path, fp] : manifest.fingerprints) {
    Object f;
    f["hash"] = Value{fp.hash};
    f["mode"] = Value{to_string(fp.mode)};
    f["kind"] = Value{to_string(fp.kind)};
    f["raw_hash"] = Value{fp.raw_hash};
    if (!fp.fallback_reason.empty()) f["fallback_reason"] = Value{fp.fallback_reason};
    files[path] = Value{std::move(f)};
  }

  Array missing;
  for (const auto& m : manifest.missing) {
    Object o;
    o["layer"] = Value{m.layer};
    o["path"] = Value{m.path};
    missing.push_back(Value{std::move(o)});
  }

  Object out;
  out["algorithm_version"] = Value{manifest.algorithm_version};
  out["layers"] = Value{std::move(layer_hashes)};
  out["layer_members"] = Value{std::move(layer_members)};
  out["files"] = Value{std::move(files)};
  out["missing"] = Value{std::move(missing)};
  return Value{std::move(out)};
}

std::string manifest_to_json(const Manifest& manifest) {
  return jsonlite::to_json(manifest_to_value(manifest));
}

std::optional<Manifest> manifest_from_value(const jsonlite::Object& obj, std::string* error) {
  using jsonlite::Object;
  Manifest mf;

  const auto* av = jsonlite::find(obj, "algorithm_version");
  if (!av || !std::holds_alternative<std::string>(av->v)) {
    fail(error, "algorithm_version missing");
    return std::nullopt;
  }
  mf.algorithm_version = std::get<std::string>(av->v);

  const auto* layers = jsonlite::find(obj, "layers");
  if (!layers || !std::holds_alternative<Object>(layers->v)) {
    fail(error, "layers missing");
    return std::nullopt;
  }
  for (const auto& [name, v] : std::get<Object>(layers->v)) {
    if (!std::holds_alternative<std::string>(v.v) || !is_hex_digest(std::get<std::string>(v.v))) {
      fail(error, "layer hash for '" + name + "' is not a digest");
      return std::nullopt;
    }
    mf.layer_hashes[name] = std::get<std::string>(v.v);
  }

  const auto* files = jsonlite::find(obj, "files");
  if (!files || !std::holds_alternative<Object>(files->v)) {
    fail(error, "files missing");
    return std::nullopt;
  }
  for (const auto& [path, v] : std::get<Object>(files->v)) {
    if (!std::holds_alternative<Object>(v.v)) {
      fail(error, "file entry '" + path + "' is not an object");
      return std::nullopt;
    }
    const auto& f = std::get<Object>(v.v);
    FileFingerprint fp;
    fp.path = path;
    fp.hash = jsonlite::get_string(f, "hash");
    fp.raw_hash = jsonlite::get_string(f, "raw_hash");
    fp.fallback_reason = jsonlite::get_string(f, "fallback_reason");
    auto mode = fingerprint_mode_from_string(jsonlite::get_string(f, "mode"));
    auto kind = file_kind_from_string(jsonlite::get_string(f, "kind"));
    if (!mode || !kind || !is_hex_digest(fp.hash) || !is_hex_digest(fp.raw_hash)) {
      fail(error, "file entry '" + path + "' is malformed");
      return std::nullopt;
    }
    fp.mode = *mode;
    fp.kind = *kind;
    mf.fingerprints[path] = std::move(fp);
  }

  const auto* members = jsonlite::find(obj, "layer_members");
  if (!members || !std::holds_alternative<Object>(members->v)) {
    fail(error, "layer_members missing");
    return std::nullopt;
  }
  for (const auto& [name, v] : std::get<Object>(members->v)) {
    if (!mf.layer_hashes.count(name) || !std::holds_alternative<jsonlite::Array>(v.v)) {
      fail(error, "layer_members entry '" + name + "' is malformed");
      return std::nullopt;
    }
    std::vector<std::string> paths;
    for (const auto& p : std::get<jsonlite::Array>(v.v)) {
      if (!std::holds_alternative<std::string>(p.v) ||
          !mf.fingerprints.count(std::get<std::string>(p.v))) {
        fail(error, "layer '" + name + "' names an unknown file");
        return std::nullopt;
      }
      paths.push_back(std::get<std::string>(p.v));
    }
    mf.layer_members[name] = std::move(paths);
  }
  if (mf.layer_members.size() != mf.layer_hashes.size()) {
    fail(error, "layer_members does not cover every layer");
    return std::nullopt;
  }

  for (const auto& m : jsonlite::get_array(obj, "missing")) {
    if (!std::holds_alternative<Object>(m.v)) {
      fail(error, "missing entry is not an object");
      return std::nullopt;
    }
    const auto& o = std::get<Object>(m.v);
    mf.missing.push_back(MissingFile{jsonlite::get_string(o, "layer"), jsonlite::get_string(o, "path"), false});
  }
  return mf;
}

}  // namespace enginecert
