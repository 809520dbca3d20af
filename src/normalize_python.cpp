#include "enginecert/normalizer.hpp"

// Python lexer for semantic normalisation.
//
// What is dropped: comments, blank lines, intra-line whitespace, explicit
// line continuations, numeric '_' separators, quote style, and (in
// strip_python_docstrings) statements made only of plain string literals.
// What is kept: every other token, and block structure as INDENT/DEDENT.
// Indentation is compared by nesting, not width, so re-indenting a file
// consistently (2 -> 4 spaces) does not change its canonical form.

#include <algorithm>
#include <cctype>
#include <cstring>

namespace enginecert {

namespace {

bool is_ident_start(unsigned char c) {
  return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool is_ident_char(unsigned char c) {
  return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool is_string_prefix(const std::string& ident) {
  std::string p = ident;
  std::transform(p.begin(), p.end(), p.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return p == "r" || p == "u" || p == "b" || p == "f" || p == "br" || p == "rb" ||
         p == "fr" || p == "rf";
}

const char* const kOps3[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* const kOps2[] = {"**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", "+=",
                             "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":="};
constexpr const char* kOps1 = "+-*/%@&|^~<>,:.;=!";

struct PyLexer {
  std::string_view s;
  std::size_t i{0};
  std::size_t line{1};
  int depth{0};
  bool at_line_start{true};
  std::vector<std::size_t> indents{0};
  std::vector<Token> out;
  ParseError* error;

  bool fail(const std::string& detail) {
    if (error) *error = ParseError{detail, line};
    return false;
  }

  bool at_eol() const { return i >= s.size() || s[i] == '\n' || s[i] == '\r'; }

  void consume_newline() {
    if (i < s.size() && s[i] == '\r') ++i;
    if (i < s.size() && s[i] == '\n') ++i;
    ++line;
  }

  void skip_comment() {
    while (!at_eol()) ++i;
  }

  void push(Token::Kind k, std::string text) { out.push_back(Token{k, std::move(text)}); }

  void push_newline() {
    if (out.empty()) return;
    const auto k = out.back().kind;
    if (k == Token::Kind::newline || k == Token::Kind::indent || k == Token::Kind::dedent) return;
    push(Token::Kind::newline, "");
  }

  // Returns false on error; sets at_line_start=false once a real line begins.
  bool handle_indentation() {
    std::size_t col = 0;
    while (i < s.size()) {
      char c = s[i];
      if (c == ' ') ++col;
      else if (c == '\t') col = (col / 8 + 1) * 8;
      else if (c == '\f') col = 0;
      else break;
      ++i;
    }
    if (i >= s.size()) return true;
    if (s[i] == '#') { skip_comment(); return true; }
    if (at_eol()) { consume_newline(); return true; }
    if (s[i] == '\\' && i + 1 < s.size() && (s[i + 1] == '\n' || s[i + 1] == '\r')) {
      // A continuation on an otherwise empty line joins the next physical line.
      ++i;
      consume_newline();
      return true;
    }

    at_line_start = false;
    if (col > indents.back()) {
      indents.push_back(col);
      push(Token::Kind::indent, "");
    } else {
      while (col < indents.back()) {
        indents.pop_back();
        push(Token::Kind::dedent, "");
      }
      if (col != indents.back()) return fail("inconsistent dedent");
    }
    return true;
  }

  bool lex_string(std::string prefix) {
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::sort(prefix.begin(), prefix.end());
    const char q = s[i];
    const bool triple = i + 2 < s.size() && s[i + 1] == q && s[i + 2] == q;
    i += triple ? 3 : 1;
    const std::size_t start_line = line;
    std::string body;
    while (true) {
      if (i >= s.size()) {
        line = start_line;
        return fail("unterminated string");
      }
      char c = s[i];
      if (c == '\\' && i + 1 < s.size()) {
        body += c;
        body += s[i + 1];
        if (s[i + 1] == '\r' && i + 2 < s.size() && s[i + 2] == '\n') {
          body += '\n';
          ++i;
        }
        if (s[i + 1] == '\n' || s[i + 1] == '\r') ++line;
        i += 2;
        continue;
      }
      if (c == q) {
        if (!triple) { ++i; break; }
        if (i + 2 < s.size() && s[i + 1] == q && s[i + 2] == q) { i += 3; break; }
      }
      if (c == '\n' || c == '\r') {
        if (!triple) {
          line = start_line;
          return fail("unterminated string");
        }
        if (c == '\n') ++line;
      }
      body += c;
      ++i;
    }
    push(Token::Kind::string, prefix + "|" + body);
    return true;
  }

  void lex_number() {
    std::string text;
    const bool hex = s[i] == '0' && i + 1 < s.size() && (s[i + 1] == 'x' || s[i + 1] == 'X');
    while (i < s.size()) {
      unsigned char c = static_cast<unsigned char>(s[i]);
      if (std::isalnum(c) || c == '.') {
        text += static_cast<char>(std::tolower(c));
        ++i;
      } else if (c == '_') {
        ++i;
      } else if ((c == '+' || c == '-') && !hex && !text.empty() && text.back() == 'e') {
        text += static_cast<char>(c);
        ++i;
      } else {
        break;
      }
    }
    push(Token::Kind::number, text);
  }

  bool lex_operator() {
    for (const char* op : kOps3) {
      if (s.compare(i, 3, op) == 0) { push(Token::Kind::op, op); i += 3; return true; }
    }
    for (const char* op : kOps2) {
      if (s.compare(i, 2, op) == 0) { push(Token::Kind::op, op); i += 2; return true; }
    }
    const char c = s[i];
    if (c == '(' || c == '[' || c == '{') {
      ++depth;
      push(Token::Kind::open, std::string(1, c));
      ++i;
      return true;
    }
    if (c == ')' || c == ']' || c == '}') {
      if (depth == 0) return fail(std::string("unmatched closing '") + c + "'");
      --depth;
      push(Token::Kind::close, std::string(1, c));
      ++i;
      return true;
    }
    if (std::strchr(kOps1, c) != nullptr) {
      push(Token::Kind::op, std::string(1, c));
      ++i;
      return true;
    }
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool run() {
    if (s.size() >= 3 && s.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
    while (i < s.size()) {
      if (at_line_start && depth == 0) {
        if (!handle_indentation()) return false;
        continue;
      }
      const unsigned char c = static_cast<unsigned char>(s[i]);
      if (c == ' ' || c == '\t' || c == '\f') { ++i; continue; }
      if (c == '\n' || c == '\r') {
        consume_newline();
        if (depth == 0) {
          push_newline();
          at_line_start = true;
        }
        continue;
      }
      if (c == '#') { skip_comment(); continue; }
      if (c == '\\') {
        if (i + 1 < s.size() && (s[i + 1] == '\n' || s[i + 1] == '\r')) {
          ++i;
          consume_newline();
          continue;
        }
        return fail("unexpected '\\'");
      }
      if (is_ident_start(c)) {
        std::string ident;
        while (i < s.size() && is_ident_char(static_cast<unsigned char>(s[i]))) ident += s[i++];
        if (i < s.size() && (s[i] == '\'' || s[i] == '"') && is_string_prefix(ident)) {
          if (!lex_string(ident)) return false;
        } else {
          push(Token::Kind::name, ident);
        }
        continue;
      }
      if (std::isdigit(c) || (c == '.' && i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1])))) {
        lex_number();
        continue;
      }
      if (c == '\'' || c == '"') {
        if (!lex_string("")) return false;
        continue;
      }
      if (!lex_operator()) return false;
    }
    if (depth != 0) return fail("unclosed bracket at end of file");
    push_newline();
    while (indents.size() > 1) {
      indents.pop_back();
      push(Token::Kind::dedent, "");
    }
    return true;
  }
};

bool is_plain_string(const Token& t) {
  if (t.kind != Token::Kind::string) return false;
  const auto bar = t.text.find('|');
  return t.text.substr(0, bar).find('f') == std::string::npos;
}

}  // namespace

std::optional<std::vector<Token>> lex_python(std::string_view src, ParseError* error) {
  PyLexer lx{src};
  lx.error = error;
  if (!lx.run()) return std::nullopt;
  return std::move(lx.out);
}

std::vector<Token> strip_python_docstrings(const std::vector<Token>& tokens) {
  std::vector<Token> out;
  out.reserve(tokens.size());
  std::vector<Token> line;
  for (const auto& t : tokens) {
    if (line.empty() && (t.kind == Token::Kind::indent || t.kind == Token::Kind::dedent)) {
      out.push_back(t);
      continue;
    }
    if (t.kind == Token::Kind::newline) {
      const bool descriptive = !line.empty() && std::all_of(line.begin(), line.end(), is_plain_string);
      if (!descriptive) {
        out.insert(out.end(), line.begin(), line.end());
        out.push_back(t);
      }
      line.clear();
      continue;
    }
    line.push_back(t);
  }
  out.insert(out.end(), line.begin(), line.end());
  return out;
}

}  // namespace enginecert
