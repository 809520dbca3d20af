#include "enginecert/types.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "enginecert/jsonlite.hpp"

namespace enginecert {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::parse_error: return "parse_error";
    case ErrorCode::missing_critical_file: return "missing_critical_file";
    case ErrorCode::hash_mismatch: return "hash_mismatch";
    case ErrorCode::ledger_unavailable: return "ledger_unavailable";
    case ErrorCode::ledger_mismatch: return "ledger_mismatch";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::baseline_invalid: return "baseline_invalid";
    case ErrorCode::receipt_invalid: return "receipt_invalid";
    case ErrorCode::algorithm_version_mismatch: return "algorithm_version_mismatch";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::evidence_integrity_failed: return "evidence_integrity_failed";
    case ErrorCode::stage_order_violation: return "stage_order_violation";
  }
  return "";
}

std::string warnings_to_json(const std::vector<Warning>& warnings) {
  std::ostringstream o;
  o << "[";
  for (size_t i = 0; i < warnings.size(); ++i) {
    if (i > 0) o << ",";
    o << "{\"code\":\"" << jsonlite::escape(warnings[i].code)
      << "\",\"detail\":\"" << jsonlite::escape(warnings[i].detail) << "\"}";
  }
  o << "]";
  return o.str();
}

std::string to_string(FileKind kind) {
  switch (kind) {
    case FileKind::python: return "python";
    case FileKind::c_family: return "c_family";
    case FileKind::json: return "json";
    case FileKind::unstructured: return "unstructured";
  }
  return "unstructured";
}

std::optional<FileKind> file_kind_from_string(const std::string& s) {
  if (s == "python") return FileKind::python;
  if (s == "c_family") return FileKind::c_family;
  if (s == "json") return FileKind::json;
  if (s == "unstructured") return FileKind::unstructured;
  return std::nullopt;
}

FileKind detect_file_kind(const std::string& path) {
  const auto slash = path.find_last_of('/');
  const auto dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return FileKind::unstructured;
  }
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == "py" || ext == "pyi") return FileKind::python;
  if (ext == "c" || ext == "cc" || ext == "cpp" || ext == "cxx" || ext == "h" ||
      ext == "hh" || ext == "hpp" || ext == "hxx" || ext == "cu" || ext == "cuh") {
    return FileKind::c_family;
  }
  if (ext == "json") return FileKind::json;
  return FileKind::unstructured;
}

std::string to_string(FingerprintMode mode) {
  return mode == FingerprintMode::semantic ? "SEMANTIC" : "RAW_FALLBACK";
}

std::optional<FingerprintMode> fingerprint_mode_from_string(const std::string& s) {
  if (s == "SEMANTIC") return FingerprintMode::semantic;
  if (s == "RAW_FALLBACK") return FingerprintMode::raw_fallback;
  return std::nullopt;
}

std::map<std::string, FileKind> LayerConfig::files() const {
  std::map<std::string, FileKind> out;
  for (const auto& [name, spec] : layers) {
    (void)name;
    for (const auto& m : spec.members) {
      out.emplace(m.path, m.kind ? *m.kind : detect_file_kind(m.path));
    }
  }
  return out;
}

bool Manifest::has_raw_fallback() const {
  return std::any_of(fingerprints.begin(), fingerprints.end(), [](const auto& kv) {
    return kv.second.mode == FingerprintMode::raw_fallback;
  });
}

std::string to_string(PipelineStage stage) {
  switch (stage) {
    case PipelineStage::init: return "INIT";
    case PipelineStage::fingerprinted: return "FINGERPRINTED";
    case PipelineStage::manifested: return "MANIFESTED";
    case PipelineStage::certified: return "CERTIFIED";
    case PipelineStage::anchored: return "ANCHORED";
    case PipelineStage::verifiable: return "VERIFIABLE";
  }
  return "INIT";
}

std::string StageFailure::to_json() const {
  std::ostringstream o;
  o << "{\"stage\":\"" << to_string(stage) << "\""
    << ",\"error\":\"" << to_string(code) << "\""
    << ",\"detail\":\"" << jsonlite::escape(detail) << "\"}";
  return o.str();
}

}  // namespace enginecert
