#pragma once

// enginecert/fingerprint.hpp — Per-file fingerprints over normalised content.
//
// A file whose normaliser succeeds is hashed over
//   kind "\n" NORMALIZER_VERSION "\n" canonical_form
// under the "file:sem:" domain. A file whose normaliser fails is hashed over
// its raw bytes and marked RAW_FALLBACK; that is never an error. The raw-bytes
// hash is recorded for every file regardless of mode.

#include <string>
#include <vector>

#include "enginecert/types.hpp"

namespace enginecert {

FileFingerprint fingerprint_file(const SourceFile& file);

// Fingerprint every file with a bounded worker pool. workers == 0 picks
// hardware_concurrency clamped to [1, 16]. The result is sorted by path and
// is identical for any worker count or scheduling order.
std::vector<FileFingerprint> fingerprint_files(const FileSet& files, unsigned workers = 0);

struct LoadedFiles {
  FileSet files;
  std::vector<MissingFile> absent;  // every (layer, path) not found on disk
  ErrorCode error{ErrorCode::none};  // io_error if a present file could not be read
  std::string error_detail;

  bool ok() const { return error == ErrorCode::none; }
};

// Read every configured member from disk under root.
LoadedFiles load_file_set(const std::string& root, const LayerConfig& config);

// Build a FileSet from in-memory contents keyed by path. Paths not in
// config are ignored; configured paths not in contents are reported absent.
LoadedFiles file_set_from_contents(const std::map<std::string, std::string>& contents,
                                   const LayerConfig& config);

unsigned resolve_worker_count(unsigned requested);

}  // namespace enginecert
