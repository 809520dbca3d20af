#include "enginecert/normalizer.hpp"

#include "enginecert/jsonlite.hpp"

namespace enginecert {

namespace {

constexpr std::size_t kMaxNestingDepth = 512;

char kind_tag(Token::Kind k) {
  switch (k) {
    case Token::Kind::name: return 'N';
    case Token::Kind::number: return 'U';
    case Token::Kind::string: return 'S';
    case Token::Kind::op: return 'O';
    case Token::Kind::open: return 'G';
    case Token::Kind::close: return 'C';
    case Token::Kind::newline: return 'L';
    case Token::Kind::indent: return 'I';
    case Token::Kind::dedent: return 'D';
    case Token::Kind::directive: return 'P';
  }
  return '?';
}

void emit_token(const Token& t, std::string& out) {
  out += kind_tag(t.kind);
  out += std::to_string(t.text.size());
  out += ':';
  out += t.text;
}

bool is_opener(const Token& t) {
  return t.kind == Token::Kind::open || t.kind == Token::Kind::indent;
}

bool is_closer(const Token& t) {
  return t.kind == Token::Kind::close || t.kind == Token::Kind::dedent;
}

bool closes(const Token& opener, const Token& closer) {
  if (opener.kind == Token::Kind::indent) return closer.kind == Token::Kind::dedent;
  if (closer.kind != Token::Kind::close) return false;
  return (opener.text == "(" && closer.text == ")") ||
         (opener.text == "[" && closer.text == "]") ||
         (opener.text == "{" && closer.text == "}");
}

struct TreeBuilder {
  const std::vector<Token>& tokens;
  std::size_t i{0};
  ParseError* error;

  bool fail(const std::string& detail) {
    if (error) *error = ParseError{detail, 0};
    return false;
  }

  // Fills node.children until the closer of node.token (or EOF at depth 0).
  bool fill(SyntaxNode& node, std::size_t depth) {
    if (depth > kMaxNestingDepth) return fail("nesting too deep");
    while (i < tokens.size()) {
      const Token& t = tokens[i];
      if (is_closer(t)) {
        if (depth == 0) return fail("unmatched closing '" + t.text + "'");
        if (!closes(node.token, t)) {
          return fail("mismatched closing '" + t.text + "' for '" + node.token.text + "'");
        }
        ++i;
        return true;
      }
      ++i;
      SyntaxNode child;
      child.token = t;
      if (is_opener(t)) {
        child.group = true;
        if (!fill(child, depth + 1)) return false;
      }
      node.children.push_back(std::move(child));
    }
    if (depth != 0) return fail("unclosed '" + node.token.text + "'");
    return true;
  }
};

void serialize_node(const SyntaxNode& node, std::string& out) {
  emit_token(node.token, out);
  if (!node.group) return;
  for (const auto& c : node.children) serialize_node(c, out);
  out += "E;";
}

}  // namespace

std::string ParseError::to_string() const {
  if (line == 0) return detail;
  return detail + " at line " + std::to_string(line);
}

std::optional<SyntaxNode> build_syntax_tree(const std::vector<Token>& tokens, ParseError* error) {
  SyntaxNode root;
  root.group = true;
  root.token = Token{Token::Kind::open, "root"};
  TreeBuilder b{tokens, 0, error};
  if (!b.fill(root, 0)) return std::nullopt;
  return root;
}

std::string serialize_syntax_tree(const SyntaxNode& root) {
  std::string out;
  for (const auto& c : root.children) serialize_node(c, out);
  return out;
}

std::optional<std::string> PythonNormalizer::normalize(std::string_view content, ParseError* error) const {
  auto tokens = lex_python(content, error);
  if (!tokens) return std::nullopt;
  auto tree = build_syntax_tree(strip_python_docstrings(*tokens), error);
  if (!tree) return std::nullopt;
  return serialize_syntax_tree(*tree);
}

std::optional<std::string> CFamilyNormalizer::normalize(std::string_view content, ParseError* error) const {
  auto tokens = lex_c_family(content, error);
  if (!tokens) return std::nullopt;
  auto tree = build_syntax_tree(*tokens, error);
  if (!tree) return std::nullopt;
  return serialize_syntax_tree(*tree);
}

std::optional<std::string> JsonNormalizer::normalize(std::string_view content, ParseError* error) const {
  std::optional<jsonlite::JsonError> err;
  auto canonical = jsonlite::canonicalize_json(std::string(content), &err);
  if (err) {
    if (error) *error = ParseError{err->code + ": " + err->message, 0};
    return std::nullopt;
  }
  return canonical;
}

std::optional<std::string> UnstructuredNormalizer::normalize(std::string_view /*content*/, ParseError* error) const {
  if (error) *error = ParseError{"no semantic parser for unstructured files", 0};
  return std::nullopt;
}

const ISemanticNormalizer& normalizer_for(FileKind kind) {
  static const PythonNormalizer python;
  static const CFamilyNormalizer c_family;
  static const JsonNormalizer json;
  static const UnstructuredNormalizer unstructured;
  switch (kind) {
    case FileKind::python: return python;
    case FileKind::c_family: return c_family;
    case FileKind::json: return json;
    case FileKind::unstructured: return unstructured;
  }
  return unstructured;
}

}  // namespace enginecert
