#include "enginecert/fingerprint.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>

#include "enginecert/hash.hpp"
#include "enginecert/normalizer.hpp"
#include "enginecert/observability.hpp"
#include "enginecert/util.hpp"
#include "enginecert/version.hpp"

namespace fs = std::filesystem;

namespace enginecert {

namespace {

// Walk every layer member once per path, recording membership and
// criticality. lookup(path, content, found, out) returns false to abort.
template <typename Lookup>
LoadedFiles collect(const LayerConfig& config, Lookup&& lookup) {
  LoadedFiles out;
  const auto kinds = config.files();
  for (const auto& [layer_name, spec] : config.layers) {
    for (const auto& m : spec.members) {
      auto it = out.files.find(m.path);
      if (it == out.files.end()) {
        std::string content;
        bool found = false;
        if (!lookup(m.path, content, found, out)) return out;
        if (!found) {
          out.absent.push_back(MissingFile{layer_name, m.path, m.critical});
          continue;
        }
        SourceFile f;
        f.path = m.path;
        f.content = std::move(content);
        f.kind = kinds.at(m.path);
        it = out.files.emplace(m.path, std::move(f)).first;
      }
      it->second.layers.insert(layer_name);
      it->second.critical = it->second.critical || m.critical;
    }
  }
  return out;
}

}  // namespace

FileFingerprint fingerprint_file(const SourceFile& file) {
  FileFingerprint fp;
  fp.path = file.path;
  fp.kind = file.kind;
  fp.raw_hash = raw_file_hash(file.content);

  ParseError err;
  auto canonical = normalizer_for(file.kind).normalize(file.content, &err);
  if (canonical) {
    fp.mode = FingerprintMode::semantic;
    fp.hash = semantic_file_hash(to_string(file.kind) + "\n" + std::to_string(version::NORMALIZER_VERSION) +
                                 "\n" + *canonical);
  } else {
    fp.mode = FingerprintMode::raw_fallback;
    fp.hash = fp.raw_hash;
    fp.fallback_reason = err.to_string();
    global_engine_stats().raw_fallbacks.fetch_add(1, std::memory_order_relaxed);
  }
  global_engine_stats().files_fingerprinted.fetch_add(1, std::memory_order_relaxed);
  return fp;
}

unsigned resolve_worker_count(unsigned requested) {
  if (requested > 0) return std::min(requested, 64u);
  return std::max(1u, std::min(16u, std::thread::hardware_concurrency()));
}

std::vector<FileFingerprint> fingerprint_files(const FileSet& files, unsigned workers) {
  std::vector<const SourceFile*> jobs;
  jobs.reserve(files.size());
  for (const auto& [path, f] : files) jobs.push_back(&f);

  // Each worker writes only its own result slots; no shared accumulator.
  std::vector<FileFingerprint> results(jobs.size());
  const unsigned n_workers = static_cast<unsigned>(
      std::min<std::size_t>(resolve_worker_count(workers), std::max<std::size_t>(1, jobs.size())));
  std::atomic<std::size_t> next_job{0};

  if (n_workers <= 1) {
    for (std::size_t i = 0; i < jobs.size(); ++i) results[i] = fingerprint_file(*jobs[i]);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(n_workers);
    for (unsigned w = 0; w < n_workers; ++w) {
      pool.emplace_back([&]() {
        for (;;) {
          const std::size_t idx = next_job.fetch_add(1);
          if (idx >= jobs.size()) break;
          results[idx] = fingerprint_file(*jobs[idx]);
        }
      });
    }
    for (auto& t : pool) t.join();
  }

  std::sort(results.begin(), results.end(),
            [](const FileFingerprint& a, const FileFingerprint& b) { return a.path < b.path; });
  return results;
}

LoadedFiles load_file_set(const std::string& root, const LayerConfig& config) {
  return collect(config, [&root](const std::string& rel, std::string& content, bool& found,
                                 LoadedFiles& out) {
    const fs::path full = fs::path(root) / rel;
    std::error_code ec;
    if (!fs::is_regular_file(full, ec)) {
      found = false;
      return true;
    }
    auto data = read_file(full.string());
    if (!data) {
      out.error = ErrorCode::io_error;
      out.error_detail = "cannot read " + rel;
      return false;
    }
    content = std::move(*data);
    found = true;
    return true;
  });
}

LoadedFiles file_set_from_contents(const std::map<std::string, std::string>& contents,
                                   const LayerConfig& config) {
  return collect(config, [&contents](const std::string& rel, std::string& content, bool& found,
                                     LoadedFiles& /*out*/) {
    auto it = contents.find(rel);
    found = it != contents.end();
    if (found) content = it->second;
    return true;
  });
}

}  // namespace enginecert
