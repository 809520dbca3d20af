#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "enginecert/baseline.hpp"
#include "enginecert/config.hpp"
#include "enginecert/evidence.hpp"
#include "enginecert/fingerprint.hpp"
#include "enginecert/hash.hpp"
#include "enginecert/jsonlite.hpp"
#include "enginecert/ledger.hpp"
#include "enginecert/manifest.hpp"
#include "enginecert/normalizer.hpp"
#include "enginecert/observability.hpp"
#include "enginecert/pipeline.hpp"
#include "enginecert/receipt.hpp"
#include "enginecert/util.hpp"
#include "enginecert/verifier.hpp"
#include "enginecert/version.hpp"

namespace fs = std::filesystem;
using namespace enginecert;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path p = fs::temp_directory_path() / ("enginecert_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

void write_text(const fs::path& p, const std::string& text) {
  fs::create_directories(p.parent_path());
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << text;
}

std::string read_text(const fs::path& p) {
  auto t = read_file(p.string());
  return t ? *t : std::string();
}

std::string semantic_hash_of(FileKind kind, const std::string& content) {
  SourceFile f;
  f.path = "x";
  f.kind = kind;
  f.content = content;
  return fingerprint_file(f).hash;
}

const char* kTimestamp = "2026-01-01T00:00:00Z";

// Three files A, B, C in layer "source", B critical.
const char* kFileA =
    "\"\"\"Energy helpers.\"\"\"\n"
    "def energy(x):\n"
    "    # scale factor\n"
    "    return x * 2.5\n";
const char* kFileB =
    "def solve(n):\n"
    "    total = 0\n"
    "    for i in range(n):\n"
    "        total += i\n"
    "    return total\n";
const char* kFileC =
    "TOLERANCE = 1e-6\n"
    "MAX_STEPS = 1000\n";

LayerConfig source_layer() {
  LayerConfig c;
  LayerSpec s;
  s.name = "source";
  s.members = {LayerMember{"a.py", false, std::nullopt}, LayerMember{"b.py", true, std::nullopt},
               LayerMember{"c.py", false, std::nullopt}};
  c.layers["source"] = s;
  return c;
}

std::map<std::string, std::string> abc_contents() {
  return {{"a.py", kFileA}, {"b.py", kFileB}, {"c.py", kFileC}};
}

CertificationReceipt sample_receipt() {
  MasterFingerprint master;
  master.algorithm_version = version::algorithm_version_tag();
  master.hash = blake3_hex("master");
  auto built = ReceiptBuilder()
                   .set_engine(EngineIdentity{"qcengine", "2.4.1"})
                   .set_validation({{"harmonic_oscillator", true}, {"hydrogen_atom", true}})
                   .set_master_fingerprint(master, 0)
                   .set_timestamp(kTimestamp)
                   .build();
  expect(built.receipt.has_value(), "sample receipt builds: " + built.detail);
  return *built.receipt;
}

AnchorPolicy fast_policy() {
  AnchorPolicy p;
  p.attempt_timeout = std::chrono::milliseconds(2000);
  p.max_attempts = 3;
  p.initial_backoff = std::chrono::milliseconds(1);
  p.max_backoff = std::chrono::milliseconds(4);
  return p;
}

// Fails the first N anchor calls with ledger_unavailable, then delegates.
class FlakyLedger : public ILedgerClient {
 public:
  FlakyLedger(std::shared_ptr<ILedgerClient> inner, int failures)
      : inner_(std::move(inner)), failures_left_(failures) {}

  LedgerWriteResult anchor(const std::string& content_hash, const LedgerMetadata& metadata) override {
    calls_.fetch_add(1);
    if (failures_left_.fetch_sub(1) > 0) {
      LedgerWriteResult r;
      r.error = ErrorCode::ledger_unavailable;
      r.detail = "connection refused";
      return r;
    }
    return inner_->anchor(content_hash, metadata);
  }
  LedgerFetchResult fetch(const std::string& transaction_id) const override {
    return inner_->fetch(transaction_id);
  }
  std::string ledger_id() const override { return "flaky:" + inner_->ledger_id(); }

  int calls() const { return calls_.load(); }

 private:
  std::shared_ptr<ILedgerClient> inner_;
  std::atomic<int> failures_left_;
  std::atomic<int> calls_{0};
};

// Never answers within any reasonable deadline.
class SlowLedger : public ILedgerClient {
 public:
  LedgerWriteResult anchor(const std::string&, const LedgerMetadata&) override {
    calls_.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    LedgerWriteResult r;
    r.ok = true;
    r.transaction_id = "late";
    return r;
  }
  LedgerFetchResult fetch(const std::string&) const override {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return LedgerFetchResult{FetchStatus::not_found, {}, "late"};
  }
  std::string ledger_id() const override { return "slow"; }
  int calls() const { return calls_.load(); }

 private:
  std::atomic<int> calls_{0};
};

// Rejects every receipt outright.
class RejectingLedger : public ILedgerClient {
 public:
  LedgerWriteResult anchor(const std::string&, const LedgerMetadata&) override {
    calls_.fetch_add(1);
    LedgerWriteResult r;
    r.error = ErrorCode::receipt_invalid;
    r.detail = "rejected";
    return r;
  }
  LedgerFetchResult fetch(const std::string&) const override {
    return LedgerFetchResult{FetchStatus::not_found, {}, ""};
  }
  std::string ledger_id() const override { return "rejecting"; }
  int calls() const { return calls_.load(); }

 private:
  std::atomic<int> calls_{0};
};

std::mutex g_events_mu;
std::vector<PipelineEvent> g_events;

void capture_event(const PipelineEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

// ============================================================================
// Hashing & JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string payload = "same bytes";
  const std::vector<std::string> hashes = {
      semantic_file_hash(payload), raw_file_hash(payload),     layer_hash(payload),
      master_hash(payload),        receipt_content_hash(payload), cas_content_hash(payload),
      ledger_record_hash(payload), blake3_hex(payload)};
  for (size_t i = 0; i < hashes.size(); ++i) {
    expect(is_hex_digest(hashes[i]), "domain hash is 64 lowercase hex");
    for (size_t j = i + 1; j < hashes.size(); ++j) {
      expect(hashes[i] != hashes[j], "distinct domains never collide on equal payloads");
    }
  }
  // Length framing: moving bytes between domain and payload changes the hash.
  expect(hash_domain("ab", "c") != hash_domain("a", "bc"), "domain/payload boundary is framed");
  expect(hash_domain("x:", payload) == hash_domain("x:", payload), "domain hash is deterministic");
}

void test_json_canonicalization() {
  std::optional<jsonlite::JsonError> err;
  const std::string a = jsonlite::canonicalize_json("{\"b\": 1, \"a\": [true, null, \"x\"]}", &err);
  expect(!err, "canonicalize valid JSON");
  expect(a == "{\"a\":[true,null,\"x\"],\"b\":1}", "keys sorted, compact: " + a);

  const std::string d1 = jsonlite::canonicalize_json("{\"v\":1}", &err);
  const std::string d2 = jsonlite::canonicalize_json("{\"v\":1.0}", &err);
  expect(d1 != d2, "integer and double stay distinct");

  jsonlite::canonicalize_json("{\"k\":1,\"k\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate keys rejected");

  err.reset();
  jsonlite::parse("{\"k\": NaN}", &err);
  expect(err.has_value(), "NaN rejected");

  err.reset();
  jsonlite::parse("{\"k\": \"\\udc00\"}", &err);
  expect(err.has_value(), "lone low surrogate rejected");
  err.reset();
  jsonlite::parse("{\"k\": \"\\ud800x\"}", &err);
  expect(err.has_value(), "lone high surrogate rejected");
  err.reset();
  const std::string pair = jsonlite::canonicalize_json("\"\\ud83d\\ude00\"", &err);
  expect(!err && pair == "\"\xF0\x9F\x98\x80\"", "surrogate pair decodes to UTF-8");

  err.reset();
  jsonlite::parse("{\"k\": 007}", &err);
  expect(err.has_value(), "leading zeros rejected");
}

void test_json_number_exactness() {
  std::optional<jsonlite::JsonError> err;
  auto canon = [&err](const std::string& text) {
    err.reset();
    const std::string out = jsonlite::canonicalize_json(text, &err);
    expect(!err, "valid number document: " + text);
    return out;
  };

  expect(canon("{\"seed\":18446744073709551617}") != canon("{\"seed\":18446744073709551616}"),
         "integers beyond u64 keep every digit");
  expect(canon("{\"seed\":18446744073709551617}") == "{\"seed\":18446744073709551617}",
         "large integer text preserved");
  expect(canon("[-9007199254740993]") != canon("[-9007199254740992]"),
         "negative integers beyond 2^53 stay distinct");
  expect(canon("[0.10000000000000000001]") != canon("[0.1]"), "long decimals stay distinct");
  expect(canon("[-0.5]") == "[-0.5]", "fraction text preserved");

  expect(canon("[1E+05]") == "[1e5]", "exponent case and plus sign are cosmetic");
  expect(canon("[2.5e-007]") == "[2.5e-7]", "exponent leading zeros are cosmetic");
  expect(canon("[1e-0]") == canon("[1e0]"), "negative zero exponent folds");
  expect(canon("[1e5]") != canon("[1e6]"), "exponent value change detected");
  expect(canon("[18446744073709551615]") == "[18446744073709551615]", "u64 max stays an integer");
}

// ============================================================================
// Normalizer & fingerprints
// ============================================================================

void test_python_cosmetic_insensitivity() {
  const std::string base = kFileA;
  const std::string cosmetic =
      "'''A completely different docstring.'''\n"
      "\n"
      "def energy( x ):   # trailing comment\n"
      "  return x*2.5\n"
      "\n";
  expect(semantic_hash_of(FileKind::python, base) == semantic_hash_of(FileKind::python, cosmetic),
         "comments, whitespace, re-indent and docstrings do not change the hash");

  expect(semantic_hash_of(FileKind::python, "name = \"alpha\"\n") ==
             semantic_hash_of(FileKind::python, "name = 'alpha'\n"),
         "quote style is cosmetic");
  expect(semantic_hash_of(FileKind::python, "n = 1_000\n") ==
             semantic_hash_of(FileKind::python, "n = 1000\n"),
         "numeric separators are cosmetic");
}

void test_python_semantic_sensitivity() {
  const std::string base = kFileA;
  const std::string h = semantic_hash_of(FileKind::python, base);

  std::string literal = base;
  literal.replace(literal.find("2.5"), 3, "2.6");
  expect(semantic_hash_of(FileKind::python, literal) != h, "numeric literal change detected");

  std::string ident = base;
  ident.replace(ident.find("x * 2.5"), 1, "y");
  expect(semantic_hash_of(FileKind::python, ident) != h, "identifier change detected");

  expect(semantic_hash_of(FileKind::python, "a = 1\nb = a + 1\n") !=
             semantic_hash_of(FileKind::python, "b = a + 1\na = 1\n"),
         "statement order change detected");

  expect(semantic_hash_of(FileKind::python, "name = 'alpha'\n") !=
             semantic_hash_of(FileKind::python, "name = 'beta'\n"),
         "value-bearing string change detected");

  expect(semantic_hash_of(FileKind::python, "if a:\n    b()\nc()\n") !=
             semantic_hash_of(FileKind::python, "if a:\n    b()\n    c()\n"),
         "block structure change detected");
}

void test_cfamily_normalization() {
  const std::string base =
      "// header comment\n"
      "int scale(int x) {\n"
      "  return x * 3; /* inline */\n"
      "}\n";
  const std::string cosmetic = "int scale(int x){return x*3;}\n";
  const std::string changed = "int scale(int x) { return x * 4; }\n";
  expect(semantic_hash_of(FileKind::c_family, base) == semantic_hash_of(FileKind::c_family, cosmetic),
         "C comments and whitespace are cosmetic");
  expect(semantic_hash_of(FileKind::c_family, base) != semantic_hash_of(FileKind::c_family, changed),
         "C literal change detected");

  expect(semantic_hash_of(FileKind::c_family, "#define F(x) (x * 2)\n") !=
             semantic_hash_of(FileKind::c_family, "#define F (x) (x * 2)\n"),
         "function-like and object-like macros differ");
  expect(semantic_hash_of(FileKind::c_family, "#define F(x) (x * 2)\n") ==
             semantic_hash_of(FileKind::c_family, "#  define   F(x)   (x*2) // doubled\n"),
         "spacing and comments inside a directive are cosmetic");
  expect(semantic_hash_of(FileKind::c_family, "#define MAX_ITER 100\nint n = MAX_ITER;\n") !=
             semantic_hash_of(FileKind::c_family, "#define MAX_ITER 200\nint n = MAX_ITER;\n"),
         "directive body change detected");
  expect(semantic_hash_of(FileKind::c_family, "#include <cmath>\n") !=
             semantic_hash_of(FileKind::c_family, "#include <cstdlib>\n"),
         "include target change detected");

  SourceFile split;
  split.path = "split.cpp";
  split.kind = FileKind::c_family;
  split.content =
      "#ifdef FAST\n"
      "int step(int x) {\n"
      "#else\n"
      "int step(long x) {\n"
      "#endif\n"
      "  return x;\n"
      "}\n";
  expect(fingerprint_file(split).mode == FingerprintMode::raw_fallback,
         "braces split across #ifdef branches take the raw fallback");
}

void test_json_normalization() {
  expect(semantic_hash_of(FileKind::json, "{\"a\": 1, \"b\": 2}") ==
             semantic_hash_of(FileKind::json, "{ \"b\":2,\n  \"a\":1 }"),
         "JSON key order and spacing are cosmetic");
  expect(semantic_hash_of(FileKind::json, "{\"a\": 1}") != semantic_hash_of(FileKind::json, "{\"a\": 2}"),
         "JSON value change detected");
  expect(semantic_hash_of(FileKind::json, "{\"seed\": 18446744073709551617}") !=
             semantic_hash_of(FileKind::json, "{\"seed\": 18446744073709551616}"),
         "JSON huge integer change detected");
  expect(semantic_hash_of(FileKind::json, "{\"offset\": -9007199254740993}") !=
             semantic_hash_of(FileKind::json, "{\"offset\": -9007199254740992}"),
         "JSON negative integer change detected");
  expect(semantic_hash_of(FileKind::json, "{\"tol\": 0.10000000000000000001}") !=
             semantic_hash_of(FileKind::json, "{\"tol\": 0.1}"),
         "JSON long decimal change detected");
}

void test_raw_fallback_on_parse_error() {
  SourceFile f;
  f.path = "broken.py";
  f.kind = FileKind::python;
  f.content = "def f(:\n    return 'unterminated\n";
  const auto fp = fingerprint_file(f);
  expect(fp.mode == FingerprintMode::raw_fallback, "parse error takes raw fallback");
  expect(fp.hash == fp.raw_hash, "fallback hash is the raw hash");
  expect(!fp.fallback_reason.empty(), "fallback reason recorded");
  expect(to_string(fp.mode) == "RAW_FALLBACK", "mode string");

  SourceFile u;
  u.path = "notes.txt";
  u.kind = detect_file_kind(u.path);
  u.content = "free text";
  expect(u.kind == FileKind::unstructured, "unknown extension is unstructured");
  expect(fingerprint_file(u).mode == FingerprintMode::raw_fallback, "unstructured kinds hash raw");

  ParseError pe;
  expect(!normalizer_for(FileKind::python).normalize("x = (1,\n", &pe).has_value(),
         "unclosed bracket is a parse error");
  expect(pe.line > 0, "parse error carries a line");
}

void test_determinism_across_workers_and_order() {
  const LayerConfig cfg = source_layer();
  const auto loaded = file_set_from_contents(abc_contents(), cfg);
  expect(loaded.ok() && loaded.absent.empty(), "in-memory file set loads");

  const auto fp1 = fingerprint_files(loaded.files, 1);
  const auto fp8 = fingerprint_files(loaded.files, 8);
  expect(fp1.size() == 3 && fp8.size() == 3, "every file fingerprinted");
  for (size_t i = 0; i < fp1.size(); ++i) {
    expect(fp1[i].path == fp8[i].path && fp1[i].hash == fp8[i].hash, "worker count never changes output");
  }

  auto shuffled = fp1;
  std::reverse(shuffled.begin(), shuffled.end());
  const auto m1 = build_manifest(cfg, fp1, {});
  const auto m2 = build_manifest(cfg, shuffled, {});
  expect(m1.ok && m2.ok, "manifests build");
  expect(m1.manifest.layer_hashes == m2.manifest.layer_hashes, "discovery order never changes layer hashes");
  expect(compute_master_fingerprint(m1.manifest).hash == compute_master_fingerprint(m2.manifest).hash,
         "discovery order never changes the master");

  for (int run = 0; run < 10; ++run) {
    const auto again = build_manifest(cfg, fingerprint_files(loaded.files, 4), {});
    expect(compute_master_fingerprint(again.manifest).hash == compute_master_fingerprint(m1.manifest).hash,
           "repeated runs are identical");
  }
}

void test_master_embeds_algorithm_version() {
  const LayerConfig cfg = source_layer();
  const auto loaded = file_set_from_contents(abc_contents(), cfg);
  const auto built = build_manifest(cfg, fingerprint_files(loaded.files), {});
  const auto master = compute_master_fingerprint(built.manifest);
  expect(master.algorithm_version == version::algorithm_version_tag(), "master carries the tag");
  expect(master_hash_of("enginecert-fp/0;normalizer/0;blake3", master.layer_hashes) != master.hash,
         "algorithm version is part of the master hash input");

  MasterFingerprint other = master;
  other.algorithm_version = "enginecert-fp/0;normalizer/0;blake3";
  expect(!master.comparable_with(other), "different algorithm versions are incomparable");
}

void test_layer_membership_overlap() {
  LayerConfig cfg = source_layer();
  LayerSpec physics;
  physics.name = "physics";
  physics.members = {LayerMember{"c.py", true, std::nullopt}};
  cfg.layers["physics"] = physics;
  const auto loaded = file_set_from_contents(abc_contents(), cfg);
  const auto built = build_manifest(cfg, fingerprint_files(loaded.files), {});
  expect(built.ok, "a path may belong to several layers");
  expect(built.manifest.layer_hashes.size() == 2, "manifest covers exactly the configured layers");
  expect(built.manifest.layer_hashes.at("source") != built.manifest.layer_hashes.at("physics"),
         "layer name is part of the layer hash");
}

// ============================================================================
// Manifest failures & the A/B/C scenario
// ============================================================================

void test_missing_critical_file() {
  const LayerConfig cfg = source_layer();
  auto contents = abc_contents();
  contents.erase("b.py");
  const auto loaded = file_set_from_contents(contents, cfg);
  expect(loaded.absent.size() == 1 && loaded.absent[0].critical, "critical absence reported");

  const auto built = build_manifest(cfg, fingerprint_files(loaded.files), loaded.absent);
  expect(!built.ok, "manifest refused");
  expect(built.error == ErrorCode::missing_critical_file, "missing_critical_file");
  expect(built.missing_critical.size() == 1 && built.missing_critical[0].path == "b.py", "names b.py");

  const fs::path dir = fresh_dir("missing_critical");
  BaselineStore store((dir / "baseline.json").string());
  const auto r = compute(cfg, loaded, store, kTimestamp);
  expect(!r.ok, "compute fails");
  expect(r.failure.stage == PipelineStage::manifested, "fails at MANIFESTED");
  expect(r.failure.code == ErrorCode::missing_critical_file, "compute reports missing_critical_file");
  expect(!store.exists(), "no baseline written on a fatal failure");
  fs::remove_all(dir);
}

void test_missing_optional_file() {
  const LayerConfig cfg = source_layer();
  auto contents = abc_contents();
  contents.erase("a.py");
  const auto loaded = file_set_from_contents(contents, cfg);
  const auto built = build_manifest(cfg, fingerprint_files(loaded.files), loaded.absent);
  expect(built.ok, "non-critical absence is not fatal");
  expect(built.manifest.missing.size() == 1 && built.manifest.missing[0].path == "a.py", "absence recorded");
  bool warned = false;
  for (const auto& w : built.warnings) warned = warned || w.code == "missing_optional_file";
  expect(warned, "missing_optional_file warning attached");
}

void test_example_scenario_end_to_end() {
  const fs::path dir = fresh_dir("scenario");
  const fs::path src = dir / "src";
  const LayerConfig cfg = source_layer();
  BaselineStore store((dir / "state" / "baseline.json").string());

  // B removed before compute.
  write_text(src / "a.py", kFileA);
  write_text(src / "c.py", kFileC);
  auto first = compute(cfg, load_file_set(src.string(), cfg), store, kTimestamp);
  expect(!first.ok && first.failure.code == ErrorCode::missing_critical_file,
         "compute without B yields missing_critical_file");

  // B restored.
  write_text(src / "b.py", kFileB);
  auto second = compute(cfg, load_file_set(src.string(), cfg), store, kTimestamp);
  expect(second.ok, "compute succeeds with B");
  expect(store.exists(), "baseline written");

  // Comment-only edit in A.
  std::string a = kFileA;
  a.replace(a.find("# scale factor"), 14, "# multiply by the calibrated scale");
  write_text(src / "a.py", a);
  auto v1 = verify(store, cfg, load_file_set(src.string(), cfg));
  expect(v1.ok, "verify runs");
  expect(v1.verification.status == LocalStatus::match, "comment edit verifies as MATCH");
  expect(v1.verification.aggregate_match, "aggregate matches");
  expect(v1.verification.cosmetic_drift_files.size() == 1 &&
             v1.verification.cosmetic_drift_files[0] == "a.py",
         "raw cross-check reports cosmetic drift in a.py");

  auto st1 = status(store, cfg, load_file_set(src.string(), cfg));
  expect(st1.ok && st1.match, "status matches after a cosmetic edit");

  Baseline foreign = *store.load().baseline;
  foreign.master.algorithm_version = "enginecert-fp/0;normalizer/0;blake3";
  foreign.manifest.algorithm_version = foreign.master.algorithm_version;
  BaselineStore foreign_store((dir / "state" / "foreign.json").string());
  std::string save_err;
  expect(foreign_store.save(foreign, &save_err), "foreign baseline saved: " + save_err);
  auto st_foreign = status(foreign_store, cfg, load_file_set(src.string(), cfg));
  expect(st_foreign.ok && !st_foreign.match, "other algorithm version never matches");
  expect(st_foreign.detail.rfind("algorithm_version_mismatch", 0) == 0, "status names the version mismatch");

  // Numeric literal change in C.
  std::string c = kFileC;
  c.replace(c.find("1000"), 4, "2000");
  write_text(src / "c.py", c);
  auto v2 = verify(store, cfg, load_file_set(src.string(), cfg));
  expect(v2.verification.status == LocalStatus::mismatch, "literal change verifies as MISMATCH");
  expect(v2.verification.diverging_layers.size() == 1 &&
             v2.verification.diverging_layers[0].layer == "source",
         "MISMATCH names layer source");
  const auto& changed = v2.verification.diverging_layers[0].changed_files;
  expect(changed.size() == 1 && changed[0] == "c.py", "only c.py changed");
  expect(v2.verification.error == ErrorCode::hash_mismatch, "MISMATCH carries hash_mismatch");

  auto st2 = status(store, cfg, load_file_set(src.string(), cfg));
  expect(st2.ok && !st2.match, "status reports no match");
  expect(st2.baseline_master == second.master.hash, "status shows the baseline master");

  // Read-only comparisons leave the manifest counter and event stream alone.
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  set_event_hook(capture_event);
  const auto built_before = global_engine_stats().manifests_built.load();
  verify(store, cfg, load_file_set(src.string(), cfg));
  status(store, cfg, load_file_set(src.string(), cfg));
  set_event_hook(nullptr);
  expect(global_engine_stats().manifests_built.load() == built_before, "verify/status record no manifest build");
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    for (const auto& ev : g_events) expect(ev.event != "manifest", "verify/status emit no manifest event");
  }

  // Verification never rewrites the baseline.
  auto reloaded = store.load();
  expect(reloaded.baseline && reloaded.baseline->master.hash == second.master.hash, "baseline untouched");
  fs::remove_all(dir);
}

void test_verify_missing_and_incomparable() {
  const LayerConfig cfg = source_layer();
  const auto full = file_set_from_contents(abc_contents(), cfg);
  const auto built = build_manifest(cfg, fingerprint_files(full.files), {});
  const Baseline baseline =
      make_baseline(built.manifest, compute_master_fingerprint(built.manifest), kTimestamp);

  auto contents = abc_contents();
  contents.erase("c.py");
  const auto partial = file_set_from_contents(contents, cfg);
  const auto missing = verify_local(baseline, cfg, partial);
  expect(missing.status == LocalStatus::missing_file, "absent baseline file is MISSING_FILE");
  expect(missing.missing_files.size() == 1 && missing.missing_files[0] == "c.py", "names c.py");
  expect(!missing.diverging_layers.empty(), "diverging layers still listed");
  expect(missing.error == ErrorCode::hash_mismatch, "non-critical disappearance carries hash_mismatch");

  contents = abc_contents();
  contents.erase("b.py");
  const auto critical = verify_local(baseline, cfg, file_set_from_contents(contents, cfg));
  expect(critical.status == LocalStatus::missing_file && critical.error == ErrorCode::missing_critical_file,
         "critical disappearance carries missing_critical_file");

  Baseline old = baseline;
  old.master.algorithm_version = "enginecert-fp/0;normalizer/0;blake3";
  const auto inc = verify_local(old, cfg, full);
  expect(inc.status == LocalStatus::incomparable, "older algorithm version is INCOMPARABLE");
  expect(to_string(inc.status) == "INCOMPARABLE", "status string");
  expect(inc.error == ErrorCode::algorithm_version_mismatch, "INCOMPARABLE carries algorithm_version_mismatch");
  expect(inc.to_json().find("\"error_code\":\"algorithm_version_mismatch\"") != std::string::npos,
         "error code exported");

  const auto same = verify_local(baseline, cfg, full);
  expect(same.status == LocalStatus::match && same.error == ErrorCode::none, "MATCH carries no error");
}

void test_verify_parse_fallback_present() {
  LayerConfig cfg = source_layer();
  LayerSpec docs;
  docs.name = "docs";
  docs.members = {LayerMember{"notes.txt", false, std::nullopt}};
  cfg.layers["docs"] = docs;
  auto contents = abc_contents();
  contents["notes.txt"] = "release notes";
  const auto loaded = file_set_from_contents(contents, cfg);
  const auto built = build_manifest(cfg, fingerprint_files(loaded.files), {});
  expect(built.manifest.has_raw_fallback(), "manifest records the fallback");
  const Baseline baseline =
      make_baseline(built.manifest, compute_master_fingerprint(built.manifest), kTimestamp);

  const auto v = verify_local(baseline, cfg, loaded);
  expect(v.status == LocalStatus::parse_fallback_present, "weakened guarantee is reported");
  expect(v.fallback_files.size() == 1 && v.fallback_files[0] == "notes.txt", "fallback file named");

  contents["notes.txt"] = "release notes.";
  const auto v2 = verify_local(baseline, cfg, file_set_from_contents(contents, cfg));
  expect(v2.status == LocalStatus::mismatch, "any byte change in a raw-hashed file is a MISMATCH");
}

// ============================================================================
// Baseline store
// ============================================================================

void test_baseline_round_trip_and_tamper() {
  const fs::path dir = fresh_dir("baseline");
  const LayerConfig cfg = source_layer();
  const auto loaded = file_set_from_contents(abc_contents(), cfg);
  BaselineStore store((dir / "baseline.json").string());
  const auto r = compute(cfg, loaded, store, kTimestamp);
  expect(r.ok, "compute writes baseline");

  auto back = store.load();
  expect(back.baseline.has_value(), "baseline loads: " + back.detail);
  expect(back.baseline->master.hash == r.master.hash, "master survives persistence");
  expect(back.baseline->manifest.fingerprints.size() == 3, "full fingerprint set persisted");
  expect(back.baseline->manifest.fingerprints.at("a.py").raw_hash ==
             r.manifest.fingerprints.at("a.py").raw_hash,
         "raw cross-check hash persisted");

  std::string text = read_text(dir / "baseline.json");
  const auto pos = text.find(kTimestamp);
  expect(pos != std::string::npos, "created_at present");
  text.replace(pos, 10, "2026-01-02");
  write_text(dir / "baseline.json", text);
  auto tampered = store.load();
  expect(!tampered.baseline.has_value(), "edited baseline rejected");
  expect(tampered.error == ErrorCode::baseline_invalid, "baseline_invalid");

  write_text(dir / "baseline.json", "{not json");
  expect(store.load().error == ErrorCode::baseline_invalid, "malformed baseline rejected");

  BaselineStore absent((dir / "nope.json").string());
  expect(absent.load().error == ErrorCode::io_error, "missing baseline is io_error");
  fs::remove_all(dir);
}

// ============================================================================
// Receipts
// ============================================================================

void test_receipt_self_consistency_and_tamper() {
  const auto r = sample_receipt();
  expect(verify_self_consistency(r), "fresh receipt is self-consistent");
  expect(r.validation_passed(), "all classes passed");
  expect(r.schema_version == version::RECEIPT_SCHEMA_VERSION, "schema version stamped");

  auto flip_validation = r;
  flip_validation.validation["hydrogen_atom"] = false;
  auto new_engine = r;
  new_engine.engine.version = "2.4.2";
  auto new_master = r;
  new_master.master_fingerprint = blake3_hex("other");
  auto new_time = r;
  new_time.timestamp = "2026-01-01T00:00:01Z";
  auto new_algo = r;
  new_algo.algorithm_version = "enginecert-fp/9;normalizer/9;blake3";
  auto new_fallbacks = r;
  new_fallbacks.raw_fallback_files = 1;
  for (const auto* m : {&flip_validation, &new_engine, &new_master, &new_time, &new_algo, &new_fallbacks}) {
    expect(!verify_self_consistency(*m), "any single-field mutation breaks self-consistency");
    expect(compute_content_hash(*m) != r.content_hash, "mutation changes the recomputed hash");
  }

  const auto parsed = parse_receipt(receipt_to_json(r));
  expect(parsed.receipt.has_value(), "exported receipt parses: " + parsed.error);
  expect(parsed.receipt->content_hash == r.content_hash, "content hash preserved");
  expect(canonical_serialize(*parsed.receipt) == canonical_serialize(r), "canonical form stable");
  expect(canonical_serialize(r).find("content_hash") == std::string::npos,
         "content_hash is not part of its own input");
}

void test_receipt_strict_whitelist() {
  const auto r = sample_receipt();
  std::optional<jsonlite::JsonError> err;

  jsonlite::Object top = jsonlite::parse(receipt_to_json(r), &err);
  top["parameters"] = jsonlite::Value{std::string("omega=1.5")};
  expect(!parse_receipt(jsonlite::to_json(jsonlite::Value{top})).receipt, "unknown top-level field rejected");

  jsonlite::Object nested = jsonlite::parse(receipt_to_json(r), &err);
  auto integrity = jsonlite::get_object(nested, "integrity");
  integrity["energy"] = jsonlite::Value{jsonlite::Number{"-13.6"}};
  nested["integrity"] = jsonlite::Value{integrity};
  expect(!parse_receipt(jsonlite::to_json(jsonlite::Value{nested})).receipt, "unknown nested field rejected");

  jsonlite::Object engine = jsonlite::parse(receipt_to_json(r), &err);
  auto e = jsonlite::get_object(engine, "engine");
  e["source"] = jsonlite::Value{std::string("def f(): pass")};
  engine["engine"] = jsonlite::Value{e};
  expect(!parse_receipt(jsonlite::to_json(jsonlite::Value{engine})).receipt, "source text cannot ride along");
}

void test_receipt_builder_rejects_bad_fields() {
  MasterFingerprint master;
  master.algorithm_version = version::algorithm_version_tag();
  master.hash = blake3_hex("m");

  auto empty = ReceiptBuilder()
                   .set_engine(EngineIdentity{"e", "1"})
                   .set_validation({})
                   .set_master_fingerprint(master, 0)
                   .set_timestamp(kTimestamp)
                   .build();
  expect(!empty.receipt && empty.error == ErrorCode::receipt_invalid, "empty validation rejected");

  auto bad_key = ReceiptBuilder()
                     .set_engine(EngineIdentity{"e", "1"})
                     .set_validation({{"has space", true}})
                     .set_master_fingerprint(master, 0)
                     .set_timestamp(kTimestamp)
                     .build();
  expect(!bad_key.receipt, "invalid problem class rejected");

  auto bad_time = ReceiptBuilder()
                      .set_engine(EngineIdentity{"e", "1"})
                      .set_validation({{"p", true}})
                      .set_master_fingerprint(master, 0)
                      .set_timestamp("yesterday")
                      .build();
  expect(!bad_time.receipt, "non-UTC timestamp rejected");

  expect(is_valid_problem_class("hydrogen_atom.v2-b"), "allowed charset");
  expect(!is_valid_problem_class(std::string(129, 'a')), "overlong class rejected");
}

void test_validation_input_formats() {
  auto flat = parse_validation_results("{\"harmonic\": true, \"hydrogen\": false}");
  expect(flat.ok && flat.results.size() == 2 && !flat.results.at("hydrogen"), "flat object accepted");

  auto claims = parse_validation_results(
      "[{\"claim_id\":\"c1\",\"verified\":true},{\"claim_id\":\"c2\",\"verified\":null},"
      "{\"claim_id\":\"c3\",\"verified\":false}]");
  expect(claims.ok && claims.results.size() == 2, "claim array accepted, null skipped");
  expect(claims.warnings.size() == 1 && claims.warnings[0].code == "validation_skipped" &&
             claims.warnings[0].detail == "c2",
         "skipped claim warned");

  expect(!parse_validation_results("[{\"claim_id\":\"c1\",\"verified\":true},"
                                   "{\"claim_id\":\"c1\",\"verified\":false}]")
              .ok,
         "duplicate claim rejected");
  const auto non_bool = parse_validation_results("{\"p\": 1}");
  expect(!non_bool.ok && non_bool.code == ErrorCode::receipt_invalid, "non-boolean verdict rejected");
  expect(!parse_validation_results("\"passed\"").ok, "scalar rejected");
  const auto malformed = parse_validation_results("{\"p\": tru}");
  expect(!malformed.ok && malformed.code == ErrorCode::parse_error, "malformed JSON is parse_error");
  expect(flat.code == ErrorCode::none, "accepted input carries no error code");
}

// ============================================================================
// Ledger anchoring & verification
// ============================================================================

void test_anchor_twice_dedupes() {
  const fs::path dir = fresh_dir("anchor_twice");
  auto ledger = std::make_shared<FileLedger>((dir / "ledger.ndjson").string());
  AnchorService service(ledger, fast_policy());
  const auto r = sample_receipt();

  const auto a1 = service.anchor(r);
  const auto a2 = service.anchor(r);
  expect(a1.ok && a2.ok, "both anchors succeed");
  expect(a1.anchor.transaction_id != a2.anchor.transaction_id, "two distinct transactions");
  expect(a1.anchor.content_hash == a2.anchor.content_hash, "identical content hash");

  const auto facts = dedupe_by_content_hash({a1.anchor, a2.anchor});
  expect(facts.size() == 1, "one certified fact");
  expect(facts[0].transaction_ids.size() == 2, "fact lists both transactions");

  EvidenceStore evidence((dir / "evidence").string());
  expect(evidence.record_anchor(a1.anchor) && evidence.record_anchor(a2.anchor), "anchors indexed");
  expect(evidence.certified_facts().size() == 1, "evidence store deduplicates by content hash");
  expect(ledger->size() == 2, "ledger holds two records");
  fs::remove_all(dir);
}

void test_ledger_verification_outcomes() {
  const fs::path dir = fresh_dir("ledger_verify");
  auto ledger = std::make_shared<FileLedger>((dir / "ledger.ndjson").string());
  AnchorService service(ledger, fast_policy());
  const auto r = sample_receipt();
  const auto a = service.anchor(r);
  expect(a.ok, "anchor succeeds");

  const auto ok = verify_against_ledger(service, a.anchor.transaction_id, r);
  expect(ok.status == LedgerStatus::authentic, "untouched receipt is AUTHENTIC");

  auto naive = r;
  naive.validation["hydrogen_atom"] = false;
  const auto t1 = verify_against_ledger(service, a.anchor.transaction_id, naive);
  expect(t1.status == LedgerStatus::tampered, "edited receipt is TAMPERED");

  auto rehashed = naive;
  rehashed.content_hash = compute_content_hash(rehashed);
  const auto t2 = verify_against_ledger(service, a.anchor.transaction_id, rehashed);
  expect(t2.status == LedgerStatus::tampered, "re-hashed edit still TAMPERED against the ledger");
  expect(std::find(t2.discrepancies.begin(), t2.discrepancies.end(), "content_hash") != t2.discrepancies.end(),
         "content hash discrepancy named");

  const auto nf = verify_against_ledger(service, blake3_hex("no such tx"), r);
  expect(nf.status == LedgerStatus::not_found, "unknown transaction is NOT_FOUND");

  AnchorPolicy quick = fast_policy();
  quick.max_attempts = 2;
  AnchorService gone(std::make_shared<FileLedger>((dir / "missing" / "ledger.ndjson").string()), quick);
  const auto un = verify_against_ledger(gone, a.anchor.transaction_id, r);
  expect(un.status == LedgerStatus::unavailable, "unreadable ledger is UNAVAILABLE");
  fs::remove_all(dir);
}

void test_ledger_chain_integrity() {
  const fs::path dir = fresh_dir("ledger_chain");
  const std::string path = (dir / "ledger.ndjson").string();
  std::string first_tx;
  {
    FileLedger ledger(path);
    const auto r = sample_receipt();
    const auto w1 = ledger.anchor(r.content_hash, metadata_for(r));
    const auto w2 = ledger.anchor(r.content_hash, metadata_for(r));
    expect(w1.ok && w2.ok, "ledger writes");
    first_tx = w1.transaction_id;
    std::string err;
    expect(ledger.verify_chain(&err), "fresh chain verifies: " + err);
  }
  {
    FileLedger resumed(path);
    expect(resumed.size() == 2, "ledger resumes from disk");
    const auto r = sample_receipt();
    expect(resumed.anchor(r.content_hash, metadata_for(r)).ok, "append after resume");
    std::string err;
    expect(resumed.verify_chain(&err), "chain continues across reopen: " + err);
  }

  std::string text = read_text(path);
  const auto pos = text.find("\"validation_passed\":true");
  expect(pos != std::string::npos, "metadata present");
  text.replace(pos, 24, "\"validation_passed\":false");
  write_text(path, text);
  FileLedger edited(path);
  std::string err;
  expect(!edited.verify_chain(&err), "edited record breaks the chain");
  expect(edited.fetch(first_tx).status == FetchStatus::not_found, "edited record no longer resolves");
  fs::remove_all(dir);
}

void test_anchor_retry_and_timeout() {
  const fs::path dir = fresh_dir("anchor_retry");
  auto inner = std::make_shared<FileLedger>((dir / "ledger.ndjson").string());
  const auto r = sample_receipt();

  auto flaky = std::make_shared<FlakyLedger>(inner, 2);
  AnchorService retrying(flaky, fast_policy());
  const auto ok = retrying.anchor(r);
  expect(ok.ok, "succeeds on the third attempt");
  expect(ok.attempts == 3 && flaky->calls() == 3, "three attempts made");

  auto down = std::make_shared<FlakyLedger>(inner, 100);
  const auto deferred = AnchorService(down, fast_policy()).anchor(r);
  expect(!deferred.ok && deferred.error == ErrorCode::ledger_unavailable, "gives up as ledger_unavailable");
  expect(deferred.attempts == 3, "attempts capped");

  AnchorPolicy tight = fast_policy();
  tight.attempt_timeout = std::chrono::milliseconds(20);
  tight.max_attempts = 2;
  const auto t0 = std::chrono::steady_clock::now();
  const auto slow = AnchorService(std::make_shared<SlowLedger>(), tight).anchor(r);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  expect(!slow.ok && slow.error == ErrorCode::ledger_unavailable, "slow ledger times out");
  expect(slow.attempts == 2, "each attempt bounded");
  expect(elapsed < std::chrono::milliseconds(250), "caller is not held for the full ledger call");

  auto rejecting = std::make_shared<RejectingLedger>();
  const auto rej = AnchorService(rejecting, fast_policy()).anchor(r);
  expect(!rej.ok && rej.error == ErrorCode::receipt_invalid, "rejection is not retried as unavailability");
  expect(rejecting->calls() == 1, "rejection stops retries");

  auto bad = r;
  bad.timestamp = "2026-01-01T00:00:09Z";
  const auto inconsistent = AnchorService(inner, fast_policy()).anchor(bad);
  expect(!inconsistent.ok && inconsistent.attempts == 0, "inconsistent receipt never reaches the ledger");

  // One abandoned call allowed: later attempts fail without a new thread.
  AnchorPolicy bounded = tight;
  bounded.max_attempts = 3;
  bounded.max_in_flight = 1;
  auto hanging = std::make_shared<SlowLedger>();
  AnchorService bounded_service(hanging, bounded);
  const auto capped = bounded_service.anchor(r);
  expect(!capped.ok && capped.attempts == 3, "every attempt still reported");
  expect(hanging->calls() <= 1, "abandoned calls capped at max_in_flight");

  // Let abandoned slow calls finish before the directory goes away.
  std::this_thread::sleep_for(std::chrono::milliseconds(350));
  bounded_service.anchor(r);
  std::this_thread::sleep_for(std::chrono::milliseconds(350));
  expect(hanging->calls() == 2, "slot freed once the abandoned call returns");
  fs::remove_all(dir);
}

// ============================================================================
// Evidence store
// ============================================================================

void test_evidence_integrity() {
  const fs::path dir = fresh_dir("evidence");
  EvidenceStore store(dir.string());
  const std::string data = "baseline snapshot bytes";
  const std::string d1 = store.put(data);
  expect(is_hex_digest(d1), "put returns digest");
  expect(store.put(data) == d1, "same bytes, same digest");
  auto got = store.read(d1);
  expect(got.data && *got.data == data, "round trip");

  const std::string obj = (dir / "objects" / d1.substr(0, 2) / d1.substr(2, 2) / d1).string();
  {
    std::fstream file(obj, std::ios::in | std::ios::out | std::ios::binary);
    expect(file.good(), "can open object file");
    char byte;
    file.read(&byte, 1);
    byte ^= 0x20;
    file.seekp(0);
    file.write(&byte, 1);
  }
  auto corrupted = store.read(d1);
  expect(!corrupted.data && corrupted.error == ErrorCode::evidence_integrity_failed,
         "altered object detected");
  expect(store.read(blake3_hex("absent")).error == ErrorCode::io_error, "absent object is io_error");
  expect(!store.read("../../etc/passwd").data, "non-digest key rejected");

  const auto r = sample_receipt();
  expect(!store.put_receipt(r).empty(), "receipt stored");
  auto found = store.find_receipt(r.content_hash);
  expect(found && found->content_hash == r.content_hash, "receipt found by content hash");
  fs::remove_all(dir);
}

#if defined(ENGINECERT_WITH_ZSTD)
void test_evidence_zstd() {
  const fs::path dir = fresh_dir("evidence_zstd");
  EvidenceStore store(dir.string());
  std::string data;
  for (int i = 0; i < 200; ++i) data += "layer source hash " + std::to_string(i % 7) + "\n";
  const std::string d = store.put(data, "zstd");
  expect(is_hex_digest(d), "compressed put returns digest");
  expect(d == cas_content_hash(data), "digest is over the uncompressed bytes");
  const auto meta = store.info(d);
  expect(meta && meta->encoding == "zstd" && meta->stored_size < data.size(), "stored compressed");
  auto got = store.read(d);
  expect(got.data && *got.data == data, "zstd round trip");

  // A sidecar claiming a different decoded size is not believed.
  const fs::path meta_file = dir / "objects" / d.substr(0, 2) / d.substr(2, 2) / (d + ".meta");
  std::string text = read_text(meta_file);
  const std::string size_field = "\"original_size\":" + std::to_string(data.size());
  expect(text.find(size_field) != std::string::npos, "sidecar records the decoded size");
  text.replace(text.find(size_field), size_field.size(), "\"original_size\":1099511627776");
  write_text(meta_file, text);
  auto inflated = store.read(d);
  expect(!inflated.data && inflated.error == ErrorCode::evidence_integrity_failed,
         "inflated original_size rejected");
  fs::remove_all(dir);
}
#endif

// ============================================================================
// Pipeline state machine
// ============================================================================

void test_pipeline_stage_order() {
  const LayerConfig cfg = source_layer();
  CertificationPipeline p(cfg, EngineIdentity{"qcengine", "2.4.1"}, 2);
  auto violations = []() {
    const auto snap = global_engine_stats().failures_snapshot();
    auto it = snap.find("stage_order_violation");
    return it == snap.end() ? uint64_t{0} : it->second;
  };
  const uint64_t violations_before = violations();
  auto early = p.certify({{"p", true}}, kTimestamp);
  expect(violations() == violations_before + 1, "one refused call is counted once");
  expect(!early.ok && early.failure.code == ErrorCode::stage_order_violation, "certify from INIT refused");
  expect(early.failure.stage == PipelineStage::certified, "names the stage that could not be reached");
  expect(p.stage() == PipelineStage::init, "refusal changes nothing");
  expect(!p.halted(), "order violation does not halt");

  expect(p.fingerprint(file_set_from_contents(abc_contents(), cfg)).ok, "fingerprint");
  expect(!p.fingerprint(file_set_from_contents(abc_contents(), cfg)).ok, "fingerprint twice refused");
  expect(p.build_manifest().ok, "manifest");
  expect(p.stage() == PipelineStage::manifested, "MANIFESTED");
}

void test_pipeline_full_run() {
  const fs::path dir = fresh_dir("pipeline");
  const LayerConfig cfg = source_layer();
  EvidenceStore evidence((dir / "evidence").string());
  CertificationPipeline p(cfg, EngineIdentity{"qcengine", "2.4.1"});
  p.set_evidence_store(&evidence);

  auto inner = std::make_shared<FileLedger>((dir / "ledger.ndjson").string());
  auto down = std::make_shared<FlakyLedger>(inner, 3);
  AnchorPolicy policy = fast_policy();
  AnchorService flaky(down, policy);

  expect(p.fingerprint(file_set_from_contents(abc_contents(), cfg)).ok, "FINGERPRINTED");
  expect(p.build_manifest().ok, "MANIFESTED");
  expect(p.certify({{"harmonic_oscillator", true}}, kTimestamp).ok, "CERTIFIED");
  expect(p.receipt() && p.receipt()->master_fingerprint == p.master().hash, "receipt carries the master");
  expect(evidence.find_receipt(p.receipt()->content_hash).has_value(), "receipt stored as evidence");

  auto deferred = p.anchor(flaky);
  expect(!deferred.ok && deferred.failure.code == ErrorCode::ledger_unavailable, "anchor deferred");
  expect(deferred.warnings.size() == 1 && deferred.warnings[0].code == "anchor_deferred", "warning attached");
  expect(p.stage() == PipelineStage::certified && !p.halted(), "receipt stays valid at CERTIFIED");

  auto retried = p.anchor(flaky);
  expect(retried.ok && p.stage() == PipelineStage::anchored, "anchor retried to ANCHORED");
  auto confirmed = p.confirm(flaky);
  expect(confirmed.ok && p.stage() == PipelineStage::verifiable, "read-back reaches VERIFIABLE");
  expect(evidence.certified_facts().size() == 1, "anchor indexed");
  fs::remove_all(dir);
}

void test_pipeline_fatal_failure_halts() {
  const LayerConfig cfg = source_layer();
  auto contents = abc_contents();
  contents.erase("b.py");
  CertificationPipeline p(cfg, EngineIdentity{"qcengine", "2.4.1"});
  expect(p.fingerprint(file_set_from_contents(contents, cfg)).ok, "fingerprint with a gap");
  auto m = p.build_manifest();
  expect(!m.ok && m.failure.code == ErrorCode::missing_critical_file, "manifest fails");
  expect(m.failure.stage == PipelineStage::manifested, "failing stage named");
  expect(p.halted(), "pipeline halted");
  auto after = p.certify({{"p", true}}, kTimestamp);
  expect(!after.ok && after.failure.code == ErrorCode::stage_order_violation, "no progress after halt");
}

// ============================================================================
// Configuration & observability
// ============================================================================

void test_config_parsing() {
  const std::string good =
      "{\"engine\":{\"name\":\"qcengine\",\"version\":\"2.4.1\"},"
      "\"source_root\":\"src\","
      "\"layers\":{\"source\":[{\"path\":\"a.py\",\"critical\":true},\"b.py\","
      "{\"path\":\"gen/params.inc\",\"kind\":\"c_family\"}]},"
      "\"anchor\":{\"timeout_ms\":100,\"max_attempts\":4},"
      "\"baseline\":\"state/baseline.json\"}";
  auto r = parse_config(good, "/srv/cert");
  expect(r.config.has_value(), "valid config parses: " + r.detail);
  expect(r.config->source_root == "/srv/cert/src", "source_root resolves against config dir");
  expect(r.config->baseline_path == "/srv/cert/state/baseline.json", "baseline resolves");
  expect(r.config->anchor.max_attempts == 4, "anchor policy read");
  expect(r.config->layers.layers.at("source").members.size() == 3, "members read");
  expect(r.config->layers.files().at("gen/params.inc") == FileKind::c_family, "explicit kind wins");

  auto expect_invalid = [](const std::string& layers, const std::string& what) {
    auto bad = parse_config("{\"engine\":{\"name\":\"e\",\"version\":\"1\"},\"layers\":" + layers + "}", "");
    expect(!bad.config && bad.error == ErrorCode::config_invalid, what);
  };
  expect_invalid("{}", "empty layer set rejected");
  expect_invalid("{\"s\":[]}", "empty layer rejected");
  expect_invalid("{\"s\":[\"a.py\",\"a.py\"]}", "duplicate member rejected");
  expect_invalid("{\"s\":[\"/etc/passwd\"]}", "absolute path rejected");
  expect_invalid("{\"s\":[\"../outside.py\"]}", "escaping path rejected");
  expect_invalid("{\"s\":[{\"path\":\"a.x\",\"kind\":\"fortran\"}]}", "unknown kind rejected");
  expect_invalid("{\"s\":[{\"path\":\"a.x\",\"kind\":\"python\"}],\"t\":[{\"path\":\"a.x\",\"kind\":\"json\"}]}",
                 "conflicting kinds rejected");
}

void test_config_rejects_mistyped_fields() {
  auto parse_with = [](const std::string& layers, const std::string& extra) {
    return parse_config("{\"engine\":{\"name\":\"e\",\"version\":\"1\"},\"layers\":" + layers + extra + "}",
                        "");
  };
  auto expect_invalid = [&parse_with](const std::string& layers, const std::string& extra,
                                      const std::string& what) {
    auto bad = parse_with(layers, extra);
    expect(!bad.config && bad.error == ErrorCode::config_invalid, what);
  };
  const std::string ok_layers = "{\"s\":[\"a.py\"]}";
  expect(parse_with(ok_layers, "").config.has_value(), "minimal config parses");

  expect_invalid("{\"s\":[{\"path\":\"b.py\",\"critical\":\"true\"}]}", "", "string critical rejected");
  expect_invalid("{\"s\":[{\"path\":\"b.py\",\"critical\":1}]}", "", "numeric critical rejected");
  expect_invalid("{\"s\":[{\"path\":7}]}", "", "non-string path rejected");
  expect_invalid("{\"s\":[{\"critical\":true}]}", "", "member without path rejected");
  expect_invalid("{\"s\":[{\"path\":\"a.py\",\"kind\":3}]}", "", "non-string kind rejected");
  expect_invalid(ok_layers, ",\"anchor\":{\"timeout_ms\":\"100\"}", "string timeout rejected");
  expect_invalid(ok_layers, ",\"anchor\":{\"max_attempts\":-1}", "negative attempts rejected");
  expect_invalid(ok_layers, ",\"anchor\":{\"max_backoff_ms\":1.5}", "fractional backoff rejected");
  expect_invalid(ok_layers, ",\"anchor\":{\"retries\":2}", "unknown anchor field rejected");
  expect_invalid(ok_layers, ",\"anchor\":{\"timeout_ms\":18446744073709551615}", "huge timeout rejected");
  expect_invalid(ok_layers, ",\"anchor\":[]", "non-object anchor rejected");
  expect_invalid(ok_layers, ",\"workers\":\"4\"", "string workers rejected");
  expect_invalid(ok_layers, ",\"workers\":100000", "absurd worker count rejected");
  expect_invalid(ok_layers, ",\"baseline\":false", "non-string baseline rejected");

  auto critical = parse_with("{\"s\":[{\"path\":\"b.py\",\"critical\":true}]}", "");
  expect(critical.config && critical.config->layers.layers.at("s").members[0].critical,
         "boolean critical honoured");
}

void test_config_env_overrides() {
  CertConfig c;
  ::setenv("ENGINECERT_LEDGER", "/tmp/enginecert_env_ledger.ndjson", 1);
  ::setenv("ENGINECERT_WORKERS", "3", 1);
  std::string err;
  expect(apply_env_overrides(c, &err), "overrides apply: " + err);
  expect(c.ledger_path == "/tmp/enginecert_env_ledger.ndjson", "ledger overridden");
  expect(c.workers == 3, "workers overridden");

  ::setenv("ENGINECERT_ANCHOR_MAX_ATTEMPTS", "many", 1);
  expect(!apply_env_overrides(c, &err), "malformed number rejected");
  ::unsetenv("ENGINECERT_ANCHOR_MAX_ATTEMPTS");
  ::unsetenv("ENGINECERT_LEDGER");
  ::unsetenv("ENGINECERT_WORKERS");

  expect(resolve_worker_count(0) >= 1 && resolve_worker_count(0) <= 16, "auto worker count clamped");
  expect(resolve_worker_count(5) == 5, "explicit worker count kept");
}

void test_observability_events() {
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  set_event_hook(capture_event);
  const auto issued_before = global_engine_stats().receipts_issued.load();

  const LayerConfig cfg = source_layer();
  CertificationPipeline p(cfg, EngineIdentity{"qcengine", "2.4.1"});
  p.fingerprint(file_set_from_contents(abc_contents(), cfg));
  p.build_manifest();
  p.certify({{"p", true}}, kTimestamp);
  set_event_hook(nullptr);

  std::vector<std::string> stages;
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    for (const auto& ev : g_events) {
      if (ev.event == "stage" && ev.ok) stages.push_back(ev.stage);
      expect(ev.detail.find("2.5") == std::string::npos, "events never carry file contents");
    }
  }
  expect(stages == std::vector<std::string>({"FINGERPRINTED", "MANIFESTED", "CERTIFIED"}),
         "one event per stage transition, in order");
  expect(global_engine_stats().receipts_issued.load() == issued_before + 1, "receipt counted");

  std::optional<jsonlite::JsonError> err;
  jsonlite::parse(global_engine_stats().to_json(), &err);
  expect(!err, "stats snapshot is valid JSON");
}

}  // namespace

int main() {
  std::cout << "=== enginecert Test Suite ===\n";

  std::cout << "\n[Hashing & JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("JSON canonicalization", test_json_canonicalization);
  run_test("JSON number exactness", test_json_number_exactness);

  std::cout << "\n[Normalizer & Fingerprints]\n";
  run_test("python cosmetic insensitivity", test_python_cosmetic_insensitivity);
  run_test("python semantic sensitivity", test_python_semantic_sensitivity);
  run_test("C family normalization", test_cfamily_normalization);
  run_test("JSON normalization", test_json_normalization);
  run_test("raw fallback on parse error", test_raw_fallback_on_parse_error);
  run_test("determinism across workers and order", test_determinism_across_workers_and_order);
  run_test("master embeds algorithm version", test_master_embeds_algorithm_version);
  run_test("overlapping layer membership", test_layer_membership_overlap);

  std::cout << "\n[Manifest & Local Verification]\n";
  run_test("missing critical file", test_missing_critical_file);
  run_test("missing optional file", test_missing_optional_file);
  run_test("A/B/C scenario end to end", test_example_scenario_end_to_end);
  run_test("missing file and incomparable", test_verify_missing_and_incomparable);
  run_test("parse fallback present", test_verify_parse_fallback_present);
  run_test("baseline round trip and tamper", test_baseline_round_trip_and_tamper);

  std::cout << "\n[Receipts]\n";
  run_test("self-consistency and tamper", test_receipt_self_consistency_and_tamper);
  run_test("strict whitelist", test_receipt_strict_whitelist);
  run_test("builder rejects bad fields", test_receipt_builder_rejects_bad_fields);
  run_test("validation input formats", test_validation_input_formats);

  std::cout << "\n[Ledger]\n";
  run_test("anchor twice, one fact", test_anchor_twice_dedupes);
  run_test("ledger verification outcomes", test_ledger_verification_outcomes);
  run_test("ledger chain integrity", test_ledger_chain_integrity);
  run_test("anchor retry and timeout", test_anchor_retry_and_timeout);

  std::cout << "\n[Evidence]\n";
  run_test("evidence integrity", test_evidence_integrity);
#if defined(ENGINECERT_WITH_ZSTD)
  run_test("zstd evidence", test_evidence_zstd);
#endif

  std::cout << "\n[Pipeline]\n";
  run_test("stage order", test_pipeline_stage_order);
  run_test("full run with deferred anchor", test_pipeline_full_run);
  run_test("fatal failure halts", test_pipeline_fatal_failure_halts);

  std::cout << "\n[Configuration & Observability]\n";
  run_test("config parsing", test_config_parsing);
  run_test("config rejects mistyped fields", test_config_rejects_mistyped_fields);
  run_test("environment overrides", test_config_env_overrides);
  run_test("pipeline events", test_observability_events);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
