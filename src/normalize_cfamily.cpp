#include "enginecert/normalizer.hpp"

// C / C++ / CUDA lexer for semantic normalisation.
//
// What is dropped: // and /* */ comments, whitespace, line splices, and
// digit separators. Preprocessor directives become a single token whose
// text is the directive re-lexed and serialised, so spacing inside a
// directive is cosmetic except for the one place the language gives it
// meaning: "#define F(x)" (function-like) vs "#define F (x)" (object-like).
//
// Conditional compilation is not evaluated. Code between #if / #else /
// #endif is lexed as one stream, so a file that opens a brace in each
// branch and closes it once after #endif is unbalanced and takes the raw
// fallback.

#include <cctype>

namespace enginecert {

namespace {

bool is_ident_start(unsigned char c) {
  return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool is_ident_char(unsigned char c) {
  return std::isalnum(c) || c == '_' || c == '$' || c >= 0x80;
}

bool is_literal_prefix(const std::string& ident) {
  return ident == "L" || ident == "u" || ident == "U" || ident == "u8" || ident == "R" ||
         ident == "LR" || ident == "uR" || ident == "UR" || ident == "u8R";
}

const char* const kOps3[] = {"<<=", ">>=", "...", "->*", "<=>"};
const char* const kOps2[] = {"::", "->", "++", "--", "<<", ">>", "<=", ">=", "==", "!=", "&&", "||",
                             "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "##", ".*"};

char tag_for(Token::Kind k) {
  switch (k) {
    case Token::Kind::name: return 'N';
    case Token::Kind::number: return 'U';
    case Token::Kind::string: return 'S';
    case Token::Kind::open: return 'G';
    case Token::Kind::close: return 'C';
    default: return 'O';
  }
}

struct CLexer {
  std::string_view s;
  bool directive_mode{false};
  std::size_t i{0};
  std::size_t line{1};
  bool line_has_token{false};
  std::vector<Token> out;
  ParseError* error{nullptr};

  bool fail(const std::string& detail) {
    if (error) *error = ParseError{detail, line};
    return false;
  }

  bool is_newline(std::size_t at) const { return at < s.size() && (s[at] == '\n' || s[at] == '\r'); }

  void consume_newline() {
    if (i < s.size() && s[i] == '\r') ++i;
    if (i < s.size() && s[i] == '\n') ++i;
    ++line;
  }

  void push(Token::Kind k, std::string text) {
    out.push_back(Token{k, std::move(text)});
    line_has_token = true;
  }

  void skip_line_comment() {
    while (i < s.size() && !is_newline(i)) {
      if (s[i] == '\\' && is_newline(i + 1)) {
        ++i;
        consume_newline();
        continue;
      }
      ++i;
    }
  }

  bool skip_block_comment() {
    const std::size_t start_line = line;
    i += 2;
    while (i < s.size()) {
      if (s[i] == '*' && i + 1 < s.size() && s[i + 1] == '/') {
        i += 2;
        return true;
      }
      if (s[i] == '\n') ++line;
      ++i;
    }
    line = start_line;
    return fail("unterminated block comment");
  }

  bool lex_quoted(const std::string& prefix) {
    const char q = s[i];
    const std::size_t start_line = line;
    std::string body;
    ++i;
    while (true) {
      if (i >= s.size() || is_newline(i)) {
        line = start_line;
        return fail(q == '"' ? "unterminated string literal" : "unterminated character literal");
      }
      char c = s[i];
      if (c == '\\' && i + 1 < s.size()) {
        if (is_newline(i + 1)) {
          ++i;
          consume_newline();
          continue;
        }
        body += c;
        body += s[i + 1];
        i += 2;
        continue;
      }
      ++i;
      if (c == q) break;
      body += c;
    }
    push(Token::Kind::string, prefix + std::string(1, q) + body);
    return true;
  }

  bool lex_raw_string(const std::string& prefix) {
    const std::size_t start_line = line;
    ++i;  // opening quote
    std::string delim;
    while (i < s.size() && s[i] != '(') {
      if (delim.size() >= 16 || s[i] == ' ' || s[i] == ')' || s[i] == '\\' || is_newline(i)) {
        return fail("invalid raw string delimiter");
      }
      delim += s[i++];
    }
    if (i >= s.size()) return fail("unterminated raw string literal");
    ++i;
    const std::string terminator = ")" + delim + "\"";
    const auto end = s.find(terminator, i);
    if (end == std::string_view::npos) {
      line = start_line;
      return fail("unterminated raw string literal");
    }
    std::string body(s.substr(i, end - i));
    for (char c : body) {
      if (c == '\n') ++line;
    }
    i = end + terminator.size();
    push(Token::Kind::string, prefix + "\"" + body);
    return true;
  }

  void lex_number() {
    std::string text;
    while (i < s.size()) {
      unsigned char c = static_cast<unsigned char>(s[i]);
      if (std::isalnum(c) || c == '.' || c == '_') {
        text += static_cast<char>(std::tolower(c));
        ++i;
      } else if (c == '\'' && i + 1 < s.size() && std::isalnum(static_cast<unsigned char>(s[i + 1]))) {
        ++i;  // digit separator
      } else if ((c == '+' || c == '-') && !text.empty() &&
                 (text.back() == 'e' || text.back() == 'p') &&
                 !(text.back() == 'e' && text.size() > 1 && text[0] == '0' && text[1] == 'x')) {
        text += static_cast<char>(c);
        ++i;
      } else {
        break;
      }
    }
    push(Token::Kind::number, text);
  }

  bool lex_directive() {
    // Collect the logical directive line with comments removed.
    ++i;  // '#'
    const std::size_t start_line = line;
    std::string body;
    while (i < s.size() && !is_newline(i)) {
      if (s[i] == '\\' && is_newline(i + 1)) {
        ++i;
        consume_newline();
        body += ' ';
        continue;
      }
      if (s[i] == '/' && i + 1 < s.size() && s[i + 1] == '/') {
        skip_line_comment();
        break;
      }
      if (s[i] == '/' && i + 1 < s.size() && s[i + 1] == '*') {
        if (!skip_block_comment()) return false;
        body += ' ';
        continue;
      }
      if (s[i] == '"' || s[i] == '\'') {
        // Copy literals verbatim so comment markers inside them survive.
        const char q = s[i];
        body += s[i++];
        while (i < s.size() && !is_newline(i) && s[i] != q) {
          if (s[i] == '\\' && i + 1 < s.size()) body += s[i++];
          body += s[i++];
        }
        if (i < s.size() && s[i] == q) body += s[i++];
        continue;
      }
      body += s[i++];
    }

    CLexer sub{body, true};
    sub.error = error;
    if (!sub.run()) {
      if (error) error->line = start_line;
      return false;
    }

    // "#define NAME(" with no space before '(' is a function-like macro.
    bool function_like = false;
    if (sub.out.size() >= 3 && sub.out[0].text == "define" && sub.out[2].text == "(") {
      std::size_t p = body.find("define");
      p += 6;
      while (p < body.size() && std::isspace(static_cast<unsigned char>(body[p]))) ++p;
      p += sub.out[1].text.size();
      function_like = p < body.size() && body[p] == '(';
    }

    std::string text;
    for (std::size_t k = 0; k < sub.out.size(); ++k) {
      if (k == 2 && function_like) text += 'F';
      const Token& t = sub.out[k];
      text += tag_for(t.kind);
      text += std::to_string(t.text.size());
      text += ':';
      text += t.text;
    }
    push(Token::Kind::directive, text);
    return true;
  }

  bool lex_operator() {
    for (const char* op : kOps3) {
      if (s.compare(i, 3, op) == 0) { push(Token::Kind::op, op); i += 3; return true; }
    }
    for (const char* op : kOps2) {
      if (s.compare(i, 2, op) == 0) { push(Token::Kind::op, op); i += 2; return true; }
    }
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c == '(' || c == '[' || c == '{') {
      push(Token::Kind::open, std::string(1, static_cast<char>(c)));
      ++i;
      return true;
    }
    if (c == ')' || c == ']' || c == '}') {
      push(Token::Kind::close, std::string(1, static_cast<char>(c)));
      ++i;
      return true;
    }
    if (c < 0x20 || c == 0x7f) return fail("unexpected control character");
    push(Token::Kind::op, std::string(1, static_cast<char>(c)));
    ++i;
    return true;
  }

  bool run() {
    if (s.size() >= 3 && s.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;
    while (i < s.size()) {
      const unsigned char c = static_cast<unsigned char>(s[i]);
      if (c == '\n' || c == '\r') {
        consume_newline();
        line_has_token = false;
        continue;
      }
      if (c == ' ' || c == '\t' || c == '\f' || c == '\v') { ++i; continue; }
      if (c == '\\' && is_newline(i + 1)) {
        ++i;
        consume_newline();
        continue;
      }
      if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') { skip_line_comment(); continue; }
      if (c == '/' && i + 1 < s.size() && s[i + 1] == '*') {
        if (!skip_block_comment()) return false;
        continue;
      }
      if (c == '#' && !line_has_token && !directive_mode) {
        if (!lex_directive()) return false;
        continue;
      }
      if (is_ident_start(c)) {
        std::string ident;
        while (i < s.size() && is_ident_char(static_cast<unsigned char>(s[i]))) ident += s[i++];
        if (i < s.size() && is_literal_prefix(ident)) {
          if (s[i] == '"' && ident.back() == 'R') {
            if (!lex_raw_string(ident)) return false;
            continue;
          }
          if ((s[i] == '"' || s[i] == '\'') && ident.back() != 'R') {
            if (!lex_quoted(ident)) return false;
            continue;
          }
        }
        push(Token::Kind::name, ident);
        continue;
      }
      if (std::isdigit(c) || (c == '.' && i + 1 < s.size() && std::isdigit(static_cast<unsigned char>(s[i + 1])))) {
        lex_number();
        continue;
      }
      if (c == '"' || c == '\'') {
        if (!lex_quoted("")) return false;
        continue;
      }
      if (!lex_operator()) return false;
    }
    return true;
  }
};

}  // namespace

std::optional<std::vector<Token>> lex_c_family(std::string_view src, ParseError* error) {
  CLexer lx{src};
  lx.error = error;
  if (!lx.run()) return std::nullopt;
  return std::move(lx.out);
}

}  // namespace enginecert
