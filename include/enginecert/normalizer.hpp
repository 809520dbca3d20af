#pragma once

// enginecert/normalizer.hpp — Semantic normalizers: source text -> canonical form.
//
// DESIGN:
//   A normalizer lexes a file into tokens, drops what cannot change
//   behaviour (whitespace, comments, docstrings), folds the remaining tokens
//   into a syntax tree by bracket / indentation nesting and serialises that
//   tree pre-order with length-prefixed tokens. Two files with the same
//   canonical form are considered semantically identical.
//
// INVARIANTS:
//   1. Value-bearing literals, identifiers, operators and statement order
//      always survive normalisation.
//   2. normalize() is a pure function of (content, NORMALIZER_VERSION).
//   3. Failure is reported through ParseError and is never fatal to the
//      pipeline: the fingerprinter falls back to hashing raw bytes.
//
// LIMITATION (c_family): preprocessor conditionals are not evaluated, so
// brackets split across #if / #else branches fail to balance and the file
// is always raw-hashed.
//
// EXTENSION_POINT: additional_file_kinds
//   Add a FileKind, implement ISemanticNormalizer for it and register it in
//   normalizer_for(). Kinds without a normalizer take the raw fallback path.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "enginecert/types.hpp"

namespace enginecert {

struct ParseError {
  std::string detail;
  std::size_t line{0};  // 1-based, 0 when not applicable

  std::string to_string() const;
};

struct Token {
  enum class Kind {
    name,
    number,
    string,
    op,
    open,       // ( [ {
    close,      // ) ] }
    newline,    // logical line end (python)
    indent,     // block open (python)
    dedent,     // block close (python)
    directive,  // preprocessor line (c_family), pre-serialised body
  };
  Kind kind{Kind::op};
  std::string text;
};

// Group nodes carry their opening token; leaves have no children.
struct SyntaxNode {
  Token token;
  std::vector<SyntaxNode> children;
  bool group{false};
};

// Fold a token stream into a tree. Fails on unbalanced or mismatched
// brackets and on blocks that never close.
std::optional<SyntaxNode> build_syntax_tree(const std::vector<Token>& tokens, ParseError* error);

// Pre-order, length-prefixed serialisation of the tree.
std::string serialize_syntax_tree(const SyntaxNode& root);

// Lexers. Comments and insignificant whitespace never appear in the output.
std::optional<std::vector<Token>> lex_python(std::string_view src, ParseError* error);
std::optional<std::vector<Token>> lex_c_family(std::string_view src, ParseError* error);

// Remove statements consisting solely of plain (non-f) string literals:
// module, class and function docstrings and other descriptive strings.
std::vector<Token> strip_python_docstrings(const std::vector<Token>& tokens);

// ---------------------------------------------------------------------------
// ISemanticNormalizer — capability implemented per supported file kind
// ---------------------------------------------------------------------------
class ISemanticNormalizer {
 public:
  virtual ~ISemanticNormalizer() = default;

  virtual FileKind kind() const = 0;

  // Returns the canonical representation, or nullopt with *error set.
  virtual std::optional<std::string> normalize(std::string_view content, ParseError* error) const = 0;
};

class PythonNormalizer : public ISemanticNormalizer {
 public:
  FileKind kind() const override { return FileKind::python; }
  std::optional<std::string> normalize(std::string_view content, ParseError* error) const override;
};

class CFamilyNormalizer : public ISemanticNormalizer {
 public:
  FileKind kind() const override { return FileKind::c_family; }
  std::optional<std::string> normalize(std::string_view content, ParseError* error) const override;
};

class JsonNormalizer : public ISemanticNormalizer {
 public:
  FileKind kind() const override { return FileKind::json; }
  std::optional<std::string> normalize(std::string_view content, ParseError* error) const override;
};

// Always fails: unstructured files are hashed raw.
class UnstructuredNormalizer : public ISemanticNormalizer {
 public:
  FileKind kind() const override { return FileKind::unstructured; }
  std::optional<std::string> normalize(std::string_view content, ParseError* error) const override;
};

// Stateless shared instances; safe for concurrent use.
const ISemanticNormalizer& normalizer_for(FileKind kind);

}  // namespace enginecert
