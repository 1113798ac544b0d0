#include "sandbox/ts_strip.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <vector>

namespace scriptbox {

namespace {

constexpr size_t kNpos = static_cast<size_t>(-1);

enum class TokKind { kIdent, kNumber, kString, kTemplate, kRegex, kPunct };

struct Token {
  TokKind kind;
  size_t begin;
  size_t end;
  bool newline_before;
};

bool IsIdentStart(unsigned char c) {
  return std::isalpha(c) || c == '_' || c == '$' || c >= 0x80;
}

bool IsIdentPart(unsigned char c) {
  return IsIdentStart(c) || std::isdigit(c);
}

// '>' is always lexed alone so nested generic closers split cleanly.
constexpr std::array<const char*, 28> kMultiPunct = {
    "...", "===", "!==", "**=", "<<=", "&&=", "||=", "??=", "=>", "==",
    "!=",  "<=",  "+=",  "-=",  "*=",  "/=",  "%=",  "&=",  "|=", "^=",
    "&&",  "||",  "??",  "?.",  "++",  "--",  "**",  "<<"};

bool IsRegexPrefixKeyword(std::string_view word) {
  static const std::array<const char*, 14> kWords = {
      "return", "typeof", "case", "do",   "else",  "in",         "of",
      "new",    "delete", "void", "throw", "yield", "instanceof", "await"};
  for (const char* w : kWords) {
    if (word == w) return true;
  }
  return false;
}

// Class member modifiers with no runtime meaning
bool IsMemberModifier(std::string_view word) {
  return word == "public" || word == "private" || word == "protected" ||
         word == "readonly" || word == "override" || word == "abstract";
}

bool IsExpressionKeyword(std::string_view word) {
  return IsRegexPrefixKeyword(word) || word == "if" || word == "while" ||
         word == "for" || word == "switch" || word == "with" ||
         word == "const" || word == "let" || word == "var" ||
         word == "import" || word == "export" || word == "from";
}

class Lexer {
 public:
  explicit Lexer(std::string_view src) : src_(src) {}

  std::vector<Token> Run() {
    std::vector<Token> toks;
    size_t i = 0;
    bool newline = false;
    const size_t n = src_.size();

    while (i < n) {
      unsigned char c = src_[i];
      char next = i + 1 < n ? src_[i + 1] : '\0';

      if (c == '\n') {
        newline = true;
        ++i;
        continue;
      }
      if (std::isspace(c)) {
        ++i;
        continue;
      }
      if (c == '/' && next == '/') {
        while (i < n && src_[i] != '\n') ++i;
        continue;
      }
      if (c == '/' && next == '*') {
        size_t close = src_.find("*/", i + 2);
        size_t stop = close == std::string_view::npos ? n : close + 2;
        if (src_.substr(i, stop - i).find('\n') != std::string_view::npos) newline = true;
        i = stop;
        continue;
      }

      size_t start = i;
      TokKind kind;
      if (IsIdentStart(c)) {
        while (i < n && IsIdentPart(src_[i])) ++i;
        kind = TokKind::kIdent;
      } else if (std::isdigit(c) || (c == '.' && std::isdigit(static_cast<unsigned char>(next)))) {
        while (i < n && (std::isalnum(static_cast<unsigned char>(src_[i])) ||
                         src_[i] == '.' || src_[i] == '_')) {
          ++i;
        }
        kind = TokKind::kNumber;
      } else if (c == '"' || c == '\'') {
        i = SkipQuoted(i);
        kind = TokKind::kString;
      } else if (c == '`') {
        i = SkipTemplate(i);
        kind = TokKind::kTemplate;
      } else if (c == '/' && RegexAllowed(toks)) {
        i = SkipRegex(i);
        kind = TokKind::kRegex;
      } else {
        i += PunctLength(i);
        kind = TokKind::kPunct;
      }
      toks.push_back({kind, start, i, newline});
      newline = false;
    }
    return toks;
  }

 private:
  size_t SkipQuoted(size_t i) const {
    char quote = src_[i++];
    while (i < src_.size() && src_[i] != quote && src_[i] != '\n') {
      if (src_[i] == '\\') ++i;
      ++i;
    }
    return std::min(i < src_.size() ? i + 1 : i, src_.size());
  }

  size_t SkipTemplate(size_t i) const {
    ++i;
    while (i < src_.size()) {
      char c = src_[i];
      if (c == '\\') {
        i += 2;
      } else if (c == '`') {
        return i + 1;
      } else if (c == '$' && i + 1 < src_.size() && src_[i + 1] == '{') {
        i = SkipTemplateExpression(i + 2);
      } else {
        ++i;
      }
    }
    return src_.size();
  }

  // Returns the position just past the '}' closing a ${ ... } substitution.
  size_t SkipTemplateExpression(size_t i) const {
    int depth = 1;
    while (i < src_.size()) {
      char c = src_[i];
      char next = i + 1 < src_.size() ? src_[i + 1] : '\0';
      if (c == '"' || c == '\'') {
        i = SkipQuoted(i);
      } else if (c == '`') {
        i = SkipTemplate(i);
      } else if (c == '/' && next == '/') {
        while (i < src_.size() && src_[i] != '\n') ++i;
      } else if (c == '/' && next == '*') {
        size_t close = src_.find("*/", i + 2);
        i = close == std::string_view::npos ? src_.size() : close + 2;
      } else if (c == '{') {
        ++depth;
        ++i;
      } else if (c == '}') {
        if (--depth == 0) return i + 1;
        ++i;
      } else {
        ++i;
      }
    }
    return src_.size();
  }

  size_t SkipRegex(size_t i) const {
    ++i;
    bool in_class = false;
    while (i < src_.size() && src_[i] != '\n') {
      char c = src_[i];
      if (c == '\\') {
        i += 2;
        continue;
      }
      if (c == '[') in_class = true;
      if (c == ']') in_class = false;
      ++i;
      if (c == '/' && !in_class) break;
    }
    while (i < src_.size() && IsIdentPart(src_[i])) ++i;
    return std::min(i, src_.size());
  }

  size_t PunctLength(size_t i) const {
    for (const char* p : kMultiPunct) {
      std::string_view candidate(p);
      if (src_.compare(i, candidate.size(), candidate) == 0) return candidate.size();
    }
    return 1;
  }

  bool RegexAllowed(const std::vector<Token>& toks) const {
    if (toks.empty()) return true;
    const Token& last = toks.back();
    std::string_view text = src_.substr(last.begin, last.end - last.begin);
    switch (last.kind) {
      case TokKind::kIdent:
        return IsRegexPrefixKeyword(text);
      case TokKind::kPunct:
        return text != ")" && text != "]" && text != "}";
      default:
        return false;
    }
  }

  std::string_view src_;
};

class Stripper {
 public:
  explicit Stripper(std::string_view src)
      : src_(src), out_(src), toks_(Lexer(src).Run()) {}

  std::string Run() {
    struct Frame {
      char open;
      bool params;
      int ternary;
      bool class_body;
    };
    std::vector<Frame> frames;
    bool in_module_clause = false;
    bool class_pending = false;
    size_t class_depth = 0;

    for (size_t t = 0; t < toks_.size(); ++t) {
      if (AtStatementStart(t)) {
        size_t end = StatementErasureEnd(t);
        if (end != kNpos) {
          Blank(t, end);
          t = end - 1;
          continue;
        }
      }

      if ((Is(t, "import") && !Is(t + 1, "(") && !Is(t + 1, ".")) ||
          (Is(t, "export") && (Is(t + 1, "{") || Is(t + 1, "*")))) {
        in_module_clause = true;
      } else if (in_module_clause && (Is(t, "from") || Is(t, ";"))) {
        in_module_clause = false;
      }

      if (Is(t, "class") && !(t > 0 && Is(t - 1, ".")) && !Is(t + 1, ":")) {
        class_pending = true;
        class_depth = frames.size();
      } else if (class_pending && frames.size() == class_depth && Is(t, "implements")) {
        size_t brace = t + 1;
        while (brace < toks_.size() && !Is(brace, "{")) ++brace;
        Blank(t, brace);
        t = brace - 1;
        continue;
      }

      if (Is(t, "(") || Is(t, "[") || Is(t, "{")) {
        bool class_body = Is(t, "{") && class_pending && frames.size() == class_depth;
        if (class_body) class_pending = false;
        frames.push_back({Text(t)[0], Is(t, "(") && IsParamList(t), 0, class_body});
        continue;
      }

      if (Is(t, ")") || Is(t, "]") || Is(t, "}")) {
        char open = Is(t, ")") ? '(' : Is(t, "]") ? '[' : '{';
        bool params = false;
        while (!frames.empty()) {
          Frame frame = frames.back();
          frames.pop_back();
          if (frame.open == open) {
            params = frame.params;
            break;
          }
        }
        if (params && Is(t + 1, ":")) {
          size_t end = SkipType(t + 2);
          if (end != kNpos && (Is(end, "{") || Is(end, "=>"))) {
            Blank(t + 1, end);
            t = end - 1;
          }
        }
        continue;
      }

      // Class members: modifiers, optional/definite markers, field types
      if (!frames.empty() && frames.back().class_body) {
        Frame& frame = frames.back();
        bool member_start = AtStatementStart(t) ||
                            (t > 0 && (IsMemberModifier(Text(t - 1)) || Is(t - 1, "static")));
        if (member_start) frame.ternary = 0;
        if (member_start && IsKind(t, TokKind::kIdent) && IsMemberModifier(Text(t)) &&
            t + 1 < toks_.size() && !toks_[t + 1].newline_before &&
            (IsKind(t + 1, TokKind::kIdent) || IsKind(t + 1, TokKind::kString) ||
             Is(t + 1, "[") || Is(t + 1, "#") || Is(t + 1, "*"))) {
          Blank(t, t + 1);
          continue;
        }
        if ((Is(t, "?") || Is(t, "!")) && Is(t + 1, ":") && t > 0 &&
            (IsKind(t - 1, TokKind::kIdent) || IsKind(t - 1, TokKind::kString) ||
             Is(t - 1, "]"))) {
          Blank(t, t + 1);
          continue;
        }
        if (Is(t, "?")) {
          ++frame.ternary;
          continue;
        }
        if (Is(t, ":")) {
          if (frame.ternary > 0) {
            --frame.ternary;
          } else if (t > 0 && (IsKind(t - 1, TokKind::kIdent) || IsKind(t - 1, TokKind::kString) ||
                               Is(t - 1, "]") || Is(t - 1, "?") || Is(t - 1, "!"))) {
            size_t end = SkipType(t + 1);
            if (end != kNpos && (end >= toks_.size() || Is(end, "=") || Is(end, ";") ||
                                 Is(end, "}") || toks_[end].newline_before)) {
              Blank(t, end);
              t = end - 1;
            }
          }
          continue;
        }
      }

      if (!frames.empty() && frames.back().params) {
        Frame& frame = frames.back();
        if (Is(t, ",")) {
          frame.ternary = 0;
        } else if (Is(t, "?")) {
          if (Is(t + 1, ":") && t > 0 && IsKind(t - 1, TokKind::kIdent)) {
            Blank(t, t + 1);
          } else {
            ++frame.ternary;
          }
          continue;
        } else if (Is(t, ":")) {
          if (frame.ternary > 0) {
            --frame.ternary;
          } else if (t > 0 && (IsKind(t - 1, TokKind::kIdent) || Is(t - 1, "}") ||
                               Is(t - 1, "]") || Is(t - 1, "?"))) {
            size_t end = SkipType(t + 1);
            if (end != kNpos && (Is(end, ",") || Is(end, ")") || Is(end, "="))) {
              Blank(t, end);
              t = end - 1;
            }
          }
          continue;
        }
      }

      if ((Is(t, "const") || Is(t, "let") || Is(t, "var")) && IsKind(t + 1, TokKind::kIdent)) {
        size_t colon = t + 2;
        if (Is(colon, "!") && Is(colon + 1, ":")) ++colon;
        if (Is(colon, ":")) {
          size_t end = SkipType(colon + 1);
          if (end != kNpos && (end >= toks_.size() || Is(end, "=") || Is(end, ";") ||
                               Is(end, ",") || toks_[end].newline_before)) {
            Blank(t + 2, end);
            t = end - 1;
          }
        }
        continue;
      }

      if ((Is(t, "as") || Is(t, "satisfies")) && !in_module_clause && t > 0 &&
          EndsExpression(t - 1) && t + 1 < toks_.size() && !toks_[t + 1].newline_before) {
        if (Is(t + 1, "const")) {
          Blank(t, t + 2);
          ++t;
          continue;
        }
        size_t end = SkipType(t + 1);
        if (end != kNpos) {
          Blank(t, end);
          t = end - 1;
        }
        continue;
      }

      if (Is(t, "!") && t > 0 && toks_[t].begin == toks_[t - 1].end &&
          (IsKind(t - 1, TokKind::kIdent) || Is(t - 1, ")") || Is(t - 1, "]")) &&
          (Is(t + 1, ".") || Is(t + 1, "?.") || Is(t + 1, ")") || Is(t + 1, "]") ||
           Is(t + 1, ",") || Is(t + 1, ";") || Is(t + 1, "["))) {
        Blank(t, t + 1);
        continue;
      }

      if (Is(t, "<") && t > 0 && IsKind(t - 1, TokKind::kIdent) &&
          !IsExpressionKeyword(Text(t - 1))) {
        size_t close = MatchTypeArguments(t);
        if (close != kNpos) {
          bool declaration =
              t >= 2 && (Is(t - 2, "function") || Is(t - 2, "class") || Is(t - 2, "extends"));
          if (Is(close + 1, "(") ||
              (declaration && (Is(close + 1, "{") || Is(close + 1, "extends")))) {
            Blank(t, close + 1);
            t = close;
          }
        }
      } else if (Is(t, "<") && (t == 0 || StartsOperand(t - 1))) {
        // Type parameters of a generic arrow function: <T,>(x: T) => x
        size_t close = MatchTypeArguments(t);
        if (close != kNpos && Is(close + 1, "(") && IsParamList(close + 1)) {
          Blank(t, close + 1);
          t = close;
        }
      }
    }
    return out_;
  }

 private:
  std::string_view Text(size_t t) const {
    return src_.substr(toks_[t].begin, toks_[t].end - toks_[t].begin);
  }

  bool Is(size_t t, std::string_view s) const {
    return t < toks_.size() && toks_[t].kind != TokKind::kString &&
           toks_[t].kind != TokKind::kTemplate && Text(t) == s;
  }

  bool IsKind(size_t t, TokKind kind) const {
    return t < toks_.size() && toks_[t].kind == kind;
  }

  bool EndsExpression(size_t t) const {
    switch (toks_[t].kind) {
      case TokKind::kIdent:
        return !IsExpressionKeyword(Text(t));
      case TokKind::kPunct:
        return Is(t, ")") || Is(t, "]") || Is(t, "}");
      default:
        return true;
    }
  }

  // True when the token after t begins an expression operand
  bool StartsOperand(size_t t) const {
    if (IsKind(t, TokKind::kIdent)) return IsRegexPrefixKeyword(Text(t));
    if (IsKind(t, TokKind::kPunct)) return !Is(t, ")") && !Is(t, "]") && !Is(t, "}");
    return false;
  }

  // Overwrite tokens [from, to) and everything between them.
  void Blank(size_t from, size_t to) {
    if (from >= to || from >= toks_.size()) return;
    size_t begin = toks_[from].begin;
    size_t end = std::min(toks_[std::min(to, toks_.size()) - 1].end, out_.size());
    for (size_t i = begin; i < end; ++i) {
      if (out_[i] != '\n' && out_[i] != '\r') out_[i] = ' ';
    }
  }

  size_t MatchClose(size_t open) const {
    int depth = 0;
    for (size_t t = open; t < toks_.size(); ++t) {
      if (Is(t, "(") || Is(t, "[") || Is(t, "{")) {
        ++depth;
      } else if (Is(t, ")") || Is(t, "]") || Is(t, "}")) {
        if (--depth == 0) return t;
      }
    }
    return kNpos;
  }

  // Generic argument list in expression position: only type-like tokens.
  size_t MatchTypeArguments(size_t open) const {
    int depth = 0;
    for (size_t t = open; t < toks_.size(); ++t) {
      if (Is(t, "<")) {
        ++depth;
      } else if (Is(t, ">")) {
        if (--depth == 0) return t > open + 1 ? t : kNpos;
      } else if (Is(t, "{") || Is(t, "(") || Is(t, "[")) {
        size_t close = MatchClose(t);
        if (close == kNpos) return kNpos;
        t = close;
      } else if (IsKind(t, TokKind::kIdent) || IsKind(t, TokKind::kString) ||
                 IsKind(t, TokKind::kNumber) || Is(t, ",") || Is(t, ".") ||
                 Is(t, "|") || Is(t, "&") || Is(t, "=>") || Is(t, "?")) {
        continue;
      } else {
        return kNpos;
      }
    }
    return kNpos;
  }

  size_t SkipType(size_t t) const {
    if (Is(t, "|") || Is(t, "&")) ++t;
    while (true) {
      t = SkipPrimaryType(t);
      if (t == kNpos) return kNpos;
      while (Is(t, "[") && !toks_[t].newline_before) {
        size_t close = MatchClose(t);
        if (close == kNpos) return kNpos;
        t = close + 1;
      }
      if (Is(t, "|") || Is(t, "&")) {
        ++t;
        continue;
      }
      return t;
    }
  }

  size_t SkipPrimaryType(size_t t) const {
    if (t >= toks_.size()) return kNpos;

    if (Is(t, "(")) {
      size_t close = MatchClose(t);
      if (close == kNpos) return kNpos;
      if (Is(close + 1, "=>")) return SkipType(close + 2);
      return close + 1;
    }
    if (Is(t, "[") || Is(t, "{")) {
      size_t close = MatchClose(t);
      return close == kNpos ? kNpos : close + 1;
    }
    if (IsKind(t, TokKind::kString) || IsKind(t, TokKind::kNumber) ||
        IsKind(t, TokKind::kTemplate)) {
      return t + 1;
    }
    if (Is(t, "-") && IsKind(t + 1, TokKind::kNumber)) return t + 2;

    if (IsKind(t, TokKind::kIdent)) {
      std::string_view word = Text(t);
      if (word == "typeof" || word == "keyof" || word == "readonly" ||
          word == "unique" || word == "infer") {
        return SkipPrimaryType(t + 1);
      }
      ++t;
      while (Is(t, ".") && IsKind(t + 1, TokKind::kIdent)) t += 2;
      if (Is(t, "<")) {
        size_t close = MatchTypeArguments(t);
        if (close == kNpos) return kNpos;
        t = close + 1;
      }
      return t;
    }
    return kNpos;
  }

  bool AtStatementStart(size_t t) const {
    if (t == 0) return true;
    return Is(t - 1, ";") || Is(t - 1, "{") || Is(t - 1, "}") || toks_[t].newline_before;
  }

  bool IsParamList(size_t open) const {
    size_t close = MatchClose(open);
    if (close == kNpos) return false;

    if (open > 0 && IsKind(open - 1, TokKind::kIdent)) {
      std::string_view prev = Text(open - 1);
      if (prev == "if" || prev == "while" || prev == "for" || prev == "switch" ||
          prev == "with") {
        return false;
      }
    }

    size_t after = close + 1;
    if (Is(after, "=>")) return true;
    if (Is(after, "{")) {
      return open > 0 && (IsKind(open - 1, TokKind::kIdent) || Is(open - 1, ">"));
    }
    if (Is(after, ":")) {
      size_t end = SkipType(after + 1);
      return end != kNpos && (Is(end, "{") || Is(end, "=>"));
    }
    return false;
  }

  // End (exclusive) of the next token run at depth 0 terminated by ';' or
  // a line break, consuming balanced brackets.
  size_t StatementEnd(size_t t) const {
    while (t < toks_.size()) {
      if (Is(t, ";")) return t + 1;
      if (Is(t, "(") || Is(t, "[") || Is(t, "{")) {
        size_t close = MatchClose(t);
        if (close == kNpos) return toks_.size();
        t = close + 1;
        if (t < toks_.size() && toks_[t].newline_before && !Is(t, "|") && !Is(t, "&")) {
          return t;
        }
        continue;
      }
      ++t;
      if (t < toks_.size() && toks_[t].newline_before && !Is(t, "|") && !Is(t, "&") &&
          !Is(t - 1, "=") && !Is(t - 1, "|") && !Is(t - 1, "&") && !Is(t - 1, ",")) {
        return t;
      }
    }
    return toks_.size();
  }

  // Statements with no runtime meaning. Returns kNpos when t starts none.
  size_t StatementErasureEnd(size_t t) const {
    size_t s = t;
    if (Is(s, "export") &&
        (Is(s + 1, "interface") || Is(s + 1, "type") || Is(s + 1, "declare"))) {
      ++s;
    }

    if (Is(s, "interface") && IsKind(s + 1, TokKind::kIdent)) {
      for (size_t u = s + 2; u < toks_.size(); ++u) {
        if (Is(u, "{")) {
          size_t close = MatchClose(u);
          return close == kNpos ? kNpos : close + 1;
        }
        if (Is(u, ";") || Is(u, "(")) break;
      }
      return kNpos;
    }

    if (Is(s, "type") && IsKind(s + 1, TokKind::kIdent) && (Is(s + 2, "=") || Is(s + 2, "<"))) {
      return StatementEnd(s);
    }

    if (Is(s, "type") && Is(s + 1, "{") && s > t) {
      return StatementEnd(s);
    }

    if (Is(s, "declare") && IsKind(s + 1, TokKind::kIdent) && !toks_[s + 1].newline_before) {
      return StatementEnd(s);
    }

    if (Is(t, "import") && Is(t + 1, "type") && !Is(t + 2, "from") && !Is(t + 2, ",")) {
      return StatementEnd(t);
    }
    return kNpos;
  }

  std::string_view src_;
  std::string out_;
  std::vector<Token> toks_;
};

}  // namespace

std::string StripTypeScript(std::string_view source) {
  return Stripper(source).Run();
}

}  // namespace scriptbox
