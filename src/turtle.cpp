/*
  Turtle writer and reader.

  Reader pipeline: Lexer (tokens with line numbers) -> Parser (triples,
  prefixes expanded, blank node property lists flattened) -> Loader (triples
  interpreted against the bacnet: vocabulary) -> NetworkGraph::from_parts.
*/
#include "bactopo/core/turtle.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "bactopo/core/error.hpp"
#include "bactopo/core/log.hpp"

namespace bactopo::core {

namespace {

// ---------------------------------------------------------------- writer

void write_iri(std::ostream& os, std::string_view iri) {
  static constexpr std::string_view kHex = "0123456789ABCDEF";
  os << '<';
  for (unsigned char c : iri) {
    if (c <= 0x20 || c == '<' || c == '>' || c == '"' || c == '{' || c == '}' ||
        c == '|' || c == '^' || c == '`' || c == '\\') {
      os << "\\u00" << kHex[c >> 4] << kHex[c & 0xF];
    } else {
      os << c;
    }
  }
  os << '>';
}

void write_string(std::ostream& os, std::string_view s) {
  static constexpr std::string_view kHex = "0123456789ABCDEF";
  os << '"';
  for (unsigned char c : s) {
    switch (c) {
      case '"': os << "\\\""; break;
      case '\\': os << "\\\\"; break;
      case '\n': os << "\\n"; break;
      case '\r': os << "\\r"; break;
      case '\t': os << "\\t"; break;
      default:
        if (c < 0x20) {
          os << "\\u00" << kHex[c >> 4] << kHex[c & 0xF];
        } else {
          os << c;
        }
    }
  }
  os << '"';
}

void write_value(std::ostream& os, const AttrValue& v) {
  if (const auto* b = std::get_if<bool>(&v)) {
    os << (*b ? "true" : "false");
  } else if (const auto* i = std::get_if<std::int64_t>(&v)) {
    os << *i;
  } else {
    write_string(os, std::get<std::string>(v));
  }
}

bool is_local_name(std::string_view key) noexcept {
  if (key.empty() || key.front() == '-') return false;
  for (char c : key) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') return false;
  }
  return true;
}

// bacnet:key for plain keys; keys carrying a foreign predicate IRI are
// written back as that IRI.
void write_predicate(std::ostream& os, const std::string& key) {
  if (is_local_name(key)) {
    os << "bacnet:" << key;
  } else if (key.find(':') != std::string::npos) {
    write_iri(os, key);
  } else {
    write_iri(os, std::string(kBacnetNamespace) + key);
  }
}

void write_prefixes(std::ostream& os) {
  os << "@prefix bacnet: <" << kBacnetNamespace << "> .\n";
  os << "@prefix rdf: <" << kRdfNamespace << "> .\n";
  os << "@prefix rdfs: <" << kRdfsNamespace << "> .\n";
  os << "@prefix xsd: <" << kXsdNamespace << "> .\n\n";
}

void write_header(std::ostream& os, const NetworkGraph& g, const DiffGraph* d) {
  write_iri(os, kSnapshotSubject);
  os << " a bacnet:Snapshot ;\n    rdfs:label ";
  write_string(os, g.name());
  if (!g.timestamp().empty()) {
    os << " ;\n    bacnet:timestamp ";
    write_string(os, g.timestamp());
    os << "^^xsd:dateTime";
  }
  if (d) {
    os << " ;\n    bacnet:diff-source-a ";
    write_string(os, d->source_a());
    os << " ;\n    bacnet:diff-source-b ";
    write_string(os, d->source_b());
  }
  os << " .\n";
}

void write_diff_mark(std::ostream& os, const DiffGraph& d, Provenance p, std::string_view indent) {
  os << " ;\n" << indent << "bacnet:" << kDiffSourcePredicate << ' ';
  write_string(os, d.source_of(p));
  os << " ;\n" << indent << "bacnet:" << kDiffProvenancePredicate << ' ';
  write_string(os, to_string(p));
}

void write_entity(std::ostream& os, const NetworkGraph& g, const Entity& e, const DiffGraph* d, Provenance p) {
  os << '\n';
  write_iri(os, e.id);
  os << " a bacnet:" << to_string(e.kind) << " ;\n    rdfs:label ";
  write_string(os, e.label);
  if (d && p != Provenance::Unchanged) write_diff_mark(os, *d, p, "    ");
  for (const auto& [key, value] : e.attributes) {
    os << " ;\n    ";
    write_predicate(os, key);
    os << ' ';
    write_value(os, value);
  }
  // out_edges is (kind, to) ordered, so equal kinds are adjacent.
  const auto out = g.out_edges(e.id);
  for (std::size_t i = 0; i < out.size(); ++i) {
    if (i > 0 && out[i].kind == out[i - 1].kind) {
      os << ",\n        ";
    } else {
      os << " ;\n    bacnet:" << to_string(out[i].kind) << ' ';
    }
    write_iri(os, out[i].to);
  }
  os << " .\n";
}

std::string write_document(const NetworkGraph& g, const DiffGraph* d) {
  std::ostringstream os;
  write_prefixes(os);
  write_header(os, g, d);
  const auto entities = g.entities();
  for (std::size_t i = 0; i < entities.size(); ++i) {
    write_entity(os, g, entities[i], d, d ? d->entity_provenance_view()[i] : Provenance::Unchanged);
  }
  if (!d) return os.str();

  const auto edges = g.edges();
  const auto prov = d->edge_provenance_view();
  bool first = true;
  for (std::size_t i = 0; i < edges.size(); ++i) {
    if (prov[i] == Provenance::Unchanged) continue;
    if (first) {
      os << "\n# added / removed statements\n";
      first = false;
    }
    os << "[ rdf:subject ";
    write_iri(os, edges[i].from);
    os << " ;\n  rdf:predicate bacnet:" << to_string(edges[i].kind) << " ;\n  rdf:object ";
    write_iri(os, edges[i].to);
    write_diff_mark(os, *d, prov[i], "  ");
    os << " ] .\n";
  }
  return os.str();
}

// ----------------------------------------------------------------- lexer

enum class Tok {
  End, Iri, PName, Blank, String, Integer, Decimal, Double, True, False, A,
  Dot, Semicolon, Comma, LBracket, RBracket, Caret2, LangTag,
  AtPrefix, AtBase, SparqlPrefix, SparqlBase
};

struct Token {
  Tok type {Tok::End};
  std::string text {};   // IRI, string value, number, blank label, pname prefix
  std::string local {};  // pname local part
  std::size_t line {1};
};

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_name_char(char c) noexcept {
  auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_' || c == '-' || u >= 0x80;
}

class Lexer {
public:
  explicit Lexer(std::string_view text) : s_(text) {}

  Token next() {
    skip_space();
    Token t;
    t.line = line_;
    if (pos_ >= s_.size()) return t;
    const char c = s_[pos_];
    switch (c) {
      case '<': t.type = Tok::Iri; t.text = lex_iri(); return t;
      case '"': case '\'': t.type = Tok::String; t.text = lex_string(c); return t;
      case '.':
        if (std::isdigit(static_cast<unsigned char>(peek(1)))) return lex_number(t);
        ++pos_; t.type = Tok::Dot; return t;
      case ';': ++pos_; t.type = Tok::Semicolon; return t;
      case ',': ++pos_; t.type = Tok::Comma; return t;
      case '[': ++pos_; t.type = Tok::LBracket; return t;
      case ']': ++pos_; t.type = Tok::RBracket; return t;
      case '^':
        if (peek(1) != '^') fail("expected '^^'");
        pos_ += 2; t.type = Tok::Caret2; return t;
      case '@': return lex_at(t);
      default: break;
    }
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        ((c == '+' || c == '-') && std::isdigit(static_cast<unsigned char>(peek(1))))) {
      return lex_number(t);
    }
    if (c == '_' && peek(1) == ':') {
      pos_ += 2;
      t.type = Tok::Blank;
      t.text = take_while_name(false);
      if (t.text.empty()) fail("empty blank node label");
      return t;
    }
    if (is_name_char(c) || c == ':') return lex_name(t);
    fail(std::string("unexpected character '") + c + "'");
  }

private:
  [[noreturn]] void fail(const std::string& what) const { throw ParseError(what, line_); }

  char peek(std::size_t off = 0) const noexcept {
    return pos_ + off < s_.size() ? s_[pos_ + off] : '\0';
  }

  void skip_space() {
    while (pos_ < s_.size()) {
      char c = s_[pos_];
      if (c == '\n') {
        ++line_;
        ++pos_;
      } else if (c == ' ' || c == '\t' || c == '\r') {
        ++pos_;
      } else if (c == '#') {
        while (pos_ < s_.size() && s_[pos_] != '\n') ++pos_;
      } else {
        break;
      }
    }
  }

  std::uint32_t read_hex(std::size_t digits) {
    std::uint32_t v = 0;
    for (std::size_t i = 0; i < digits; ++i) {
      char h = peek();
      int d;
      if (h >= '0' && h <= '9') d = h - '0';
      else if (h >= 'a' && h <= 'f') d = h - 'a' + 10;
      else if (h >= 'A' && h <= 'F') d = h - 'A' + 10;
      else fail("bad hex digit in escape");
      v = (v << 4) | static_cast<std::uint32_t>(d);
      ++pos_;
    }
    return v;
  }

  void read_escape(std::string& out, bool iri) {
    char e = peek();
    ++pos_;
    if (e == 'u') { append_utf8(out, read_hex(4)); return; }
    if (e == 'U') { append_utf8(out, read_hex(8)); return; }
    if (iri) fail("only \\u and \\U escapes are allowed in IRIs");
    switch (e) {
      case 't': out.push_back('\t'); break;
      case 'b': out.push_back('\b'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 'f': out.push_back('\f'); break;
      case '"': out.push_back('"'); break;
      case '\'': out.push_back('\''); break;
      case '\\': out.push_back('\\'); break;
      default: fail(std::string("unknown escape '\\") + e + "'");
    }
  }

  std::string lex_iri() {
    ++pos_;
    std::string out;
    for (;;) {
      if (pos_ >= s_.size()) fail("unterminated IRI");
      char c = s_[pos_];
      if (c == '>') { ++pos_; return out; }
      if (c == '\\') { ++pos_; read_escape(out, true); continue; }
      if (static_cast<unsigned char>(c) <= 0x20) fail("whitespace in IRI");
      out.push_back(c);
      ++pos_;
    }
  }

  std::string lex_string(char quote) {
    const bool long_form = peek(1) == quote && peek(2) == quote;
    pos_ += long_form ? 3 : 1;
    std::string out;
    for (;;) {
      if (pos_ >= s_.size()) fail("unterminated string");
      char c = s_[pos_];
      if (long_form && c == quote && peek(1) == quote && peek(2) == quote) {
        pos_ += 3;
        return out;
      }
      if (!long_form && c == quote) {
        ++pos_;
        return out;
      }
      if (!long_form && (c == '\n' || c == '\r')) fail("newline in string");
      if (c == '\\') {
        ++pos_;
        read_escape(out, false);
        continue;
      }
      if (c == '\n') ++line_;
      out.push_back(c);
      ++pos_;
    }
  }

  Token lex_number(Token t) {
    auto digits = [this] {
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    };
    const auto start = pos_;
    if (peek() == '+' || peek() == '-') ++pos_;
    digits();
    t.type = Tok::Integer;
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
      ++pos_;
      digits();
      t.type = Tok::Decimal;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("bad exponent");
      digits();
      t.type = Tok::Double;
    }
    t.text = std::string(s_.substr(start, pos_ - start));
    return t;
  }

  Token lex_at(Token t) {
    ++pos_;
    std::string word;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '-') word.push_back(s_[pos_++]);
    if (word == "prefix") t.type = Tok::AtPrefix;
    else if (word == "base") t.type = Tok::AtBase;
    else if (!word.empty()) { t.type = Tok::LangTag; t.text = word; }
    else fail("expected directive or language tag after '@'");
    return t;
  }

  // Name characters plus interior dots; a trailing dot is left for the
  // statement terminator.
  std::string take_while_name(bool allow_colon) {
    std::string out;
    while (pos_ < s_.size()) {
      char c = s_[pos_];
      if (is_name_char(c) || c == '.' || (allow_colon && c == ':')) {
        out.push_back(c);
        ++pos_;
      } else if (allow_colon && c == '\\' && pos_ + 1 < s_.size()) {
        out.push_back(s_[pos_ + 1]);
        pos_ += 2;
      } else if (allow_colon && c == '%' && pos_ + 2 < s_.size()) {
        out.append(s_.substr(pos_, 3));
        pos_ += 3;
      } else {
        break;
      }
    }
    while (!out.empty() && out.back() == '.') {
      out.pop_back();
      --pos_;
    }
    return out;
  }

  Token lex_name(Token t) {
    std::string prefix = take_while_name(false);
    if (peek() == ':') {
      ++pos_;
      t.type = Tok::PName;
      t.text = std::move(prefix);
      t.local = take_while_name(true);
      return t;
    }
    if (prefix == "a") { t.type = Tok::A; return t; }
    if (prefix == "true") { t.type = Tok::True; return t; }
    if (prefix == "false") { t.type = Tok::False; return t; }
    std::string upper;
    for (char c : prefix) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (upper == "PREFIX") { t.type = Tok::SparqlPrefix; return t; }
    if (upper == "BASE") { t.type = Tok::SparqlBase; return t; }
    fail("unexpected word '" + prefix + "'");
  }

  std::string_view s_;
  std::size_t pos_ {0};
  std::size_t line_ {1};
};

// ---------------------------------------------------------------- parser

struct Term {
  enum class Kind { Iri, Blank, Literal };
  Kind kind {Kind::Iri};
  std::string value {};
  std::string datatype {};  // literals only
};

struct Triple {
  Term subject;
  std::string predicate;
  Term object;
  std::size_t line {0};
};

class Parser {
public:
  explicit Parser(std::string_view text) : lex_(text) {}

  std::vector<Triple> parse() {
    advance();
    while (tok_.type != Tok::End) {
      switch (tok_.type) {
        case Tok::AtPrefix:
          advance();
          parse_prefix();
          expect(Tok::Dot, "'.' after @prefix");
          break;
        case Tok::SparqlPrefix:
          advance();
          parse_prefix();
          break;
        case Tok::AtBase:
          advance();
          parse_base();
          expect(Tok::Dot, "'.' after @base");
          break;
        case Tok::SparqlBase:
          advance();
          parse_base();
          break;
        default:
          parse_triples();
          expect(Tok::Dot, "'.' at end of statement");
      }
    }
    return std::move(triples_);
  }

private:
  [[noreturn]] void fail(const std::string& what) const { throw ParseError(what, tok_.line); }

  void advance() { tok_ = lex_.next(); }

  void expect(Tok type, const char* what) {
    if (tok_.type != type) fail(std::string("expected ") + what);
    advance();
  }

  void parse_prefix() {
    if (tok_.type != Tok::PName || !tok_.local.empty()) fail("expected prefix name");
    auto name = tok_.text;
    advance();
    if (tok_.type != Tok::Iri) fail("expected IRI for prefix '" + name + "'");
    prefixes_[name] = resolve(tok_.text);
    advance();
  }

  void parse_base() {
    if (tok_.type != Tok::Iri) fail("expected base IRI");
    base_ = resolve(tok_.text);
    advance();
  }

  // Relative IRIs are appended to @base; good enough for hand-written files.
  std::string resolve(const std::string& iri) const {
    if (base_.empty() || iri.find(':') != std::string::npos) return iri;
    return base_ + iri;
  }

  std::string expand(const Token& t) const {
    auto it = prefixes_.find(t.text);
    if (it == prefixes_.end()) fail("undeclared prefix '" + t.text + ":'");
    return it->second + t.local;
  }

  void parse_triples() {
    if (tok_.type == Tok::LBracket) {
      auto subject = parse_blank_property_list();
      if (tok_.type != Tok::Dot) parse_predicate_object_list(subject);
      return;
    }
    Term subject;
    switch (tok_.type) {
      case Tok::Iri: subject = Term{Term::Kind::Iri, resolve(tok_.text), {}}; break;
      case Tok::PName: subject = Term{Term::Kind::Iri, expand(tok_), {}}; break;
      case Tok::Blank: subject = Term{Term::Kind::Blank, "_:" + tok_.text, {}}; break;
      default: fail("expected subject");
    }
    advance();
    parse_predicate_object_list(subject);
  }

  void parse_predicate_object_list(const Term& subject) {
    for (;;) {
      auto predicate = parse_verb();
      parse_object_list(subject, predicate);
      if (tok_.type != Tok::Semicolon) return;
      while (tok_.type == Tok::Semicolon) advance();
      if (tok_.type == Tok::Dot || tok_.type == Tok::RBracket) return;
    }
  }

  std::string parse_verb() {
    std::string out;
    switch (tok_.type) {
      case Tok::A: out = std::string(kRdfNamespace) + "type"; break;
      case Tok::Iri: out = resolve(tok_.text); break;
      case Tok::PName: out = expand(tok_); break;
      default: fail("expected predicate");
    }
    advance();
    return out;
  }

  void parse_object_list(const Term& subject, const std::string& predicate) {
    for (;;) {
      auto line = tok_.line;
      auto object = parse_object();
      triples_.push_back(Triple{subject, predicate, std::move(object), line});
      if (tok_.type != Tok::Comma) return;
      advance();
    }
  }

  Term parse_object() {
    Term t;
    switch (tok_.type) {
      case Tok::Iri: t = Term{Term::Kind::Iri, resolve(tok_.text), {}}; break;
      case Tok::PName: t = Term{Term::Kind::Iri, expand(tok_), {}}; break;
      case Tok::Blank: t = Term{Term::Kind::Blank, "_:" + tok_.text, {}}; break;
      case Tok::LBracket: return parse_blank_property_list();
      case Tok::String: return parse_string_literal();
      case Tok::Integer: t = literal(tok_.text, "integer"); break;
      case Tok::Decimal: t = literal(tok_.text, "decimal"); break;
      case Tok::Double: t = literal(tok_.text, "double"); break;
      case Tok::True: t = literal("true", "boolean"); break;
      case Tok::False: t = literal("false", "boolean"); break;
      default: fail("expected object");
    }
    advance();
    return t;
  }

  static Term literal(std::string value, const char* xsd_type) {
    return Term{Term::Kind::Literal, std::move(value), std::string(kXsdNamespace) + xsd_type};
  }

  Term parse_string_literal() {
    Term t = literal(tok_.text, "string");
    advance();
    if (tok_.type == Tok::LangTag) {
      t.datatype = std::string(kRdfNamespace) + "langString";
      advance();
    } else if (tok_.type == Tok::Caret2) {
      advance();
      if (tok_.type == Tok::Iri) t.datatype = resolve(tok_.text);
      else if (tok_.type == Tok::PName) t.datatype = expand(tok_);
      else fail("expected datatype IRI after '^^'");
      advance();
    }
    return t;
  }

  Term parse_blank_property_list() {
    advance();  // '['
    Term node{Term::Kind::Blank, "_:#g" + std::to_string(next_blank_++), {}};
    if (tok_.type != Tok::RBracket) parse_predicate_object_list(node);
    expect(Tok::RBracket, "']'");
    return node;
  }

  Lexer lex_;
  Token tok_ {};
  std::map<std::string, std::string> prefixes_ {};
  std::string base_ {};
  std::size_t next_blank_ {0};
  std::vector<Triple> triples_ {};
};

// ---------------------------------------------------------------- loader

std::string rdf(std::string_view local) { return std::string(kRdfNamespace) + std::string(local); }
std::string rdfs(std::string_view local) { return std::string(kRdfsNamespace) + std::string(local); }
std::string bacnet_iri(std::string_view local) { return std::string(kBacnetNamespace) + std::string(local); }

std::optional<std::string_view> bacnet_local(std::string_view iri) noexcept {
  if (iri.size() <= kBacnetNamespace.size() || iri.substr(0, kBacnetNamespace.size()) != kBacnetNamespace) {
    return std::nullopt;
  }
  return iri.substr(kBacnetNamespace.size());
}

AttrValue literal_value(const Term& t) {
  if (t.kind != Term::Kind::Literal) return t.value;
  const auto xsd = std::string(kXsdNamespace);
  if (t.datatype == xsd + "integer" || t.datatype == xsd + "int" || t.datatype == xsd + "long") {
    std::int64_t v = 0;
    const char* first = t.value.data();
    const char* last = first + t.value.size();
    if (*first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec == std::errc() && ptr == last) return v;
    return t.value;
  }
  if (t.datatype == xsd + "boolean") {
    if (t.value == "true" || t.value == "1") return true;
    if (t.value == "false" || t.value == "0") return false;
  }
  return t.value;
}

struct SourceMark {
  std::optional<std::string> source;
  std::optional<Provenance> provenance;
  std::size_t line {0};

  [[nodiscard]] bool empty() const noexcept { return !source && !provenance; }
};

struct Reified {
  std::string subject;
  std::string predicate;
  std::string object;
  SourceMark mark;
  std::size_t line {0};
};

struct Loaded {
  std::string name;
  std::string timestamp;
  std::optional<std::string> source_a;
  std::optional<std::string> source_b;
  std::map<std::string, Entity> entities;
  std::vector<Edge> edges;
  std::map<std::string, SourceMark> entity_source;
  std::map<Edge, SourceMark> edge_source;
};

std::string literal_text(const Triple& t) {
  if (t.object.kind != Term::Kind::Literal) throw ParseError("expected a literal for " + t.predicate, t.line);
  return t.object.value;
}

Provenance provenance_literal(const Triple& t) {
  const auto text = literal_text(t);
  if (text == to_string(Provenance::Added)) return Provenance::Added;
  if (text == to_string(Provenance::Removed)) return Provenance::Removed;
  throw ParseError("diff provenance must be \"added\" or \"removed\", got '" + text + "'", t.line);
}

Loaded load(std::string_view text) {
  const auto triples = Parser(text).parse();
  const auto rdf_type = rdf("type");
  const auto rdfs_label = rdfs("label");

  Loaded out;
  std::set<std::string> headers;
  for (const auto& t : triples) {
    if (t.predicate != rdf_type || t.subject.kind != Term::Kind::Iri || t.object.kind != Term::Kind::Iri) continue;
    auto local = bacnet_local(t.object.value);
    if (!local) continue;
    if (*local == "Snapshot") {
      headers.insert(t.subject.value);
    } else if (auto kind = entity_kind_from_string(*local)) {
      auto [it, inserted] = out.entities.try_emplace(t.subject.value, Entity{t.subject.value, *kind, {}, {}});
      if (!inserted && it->second.kind != *kind) {
        throw ParseError("conflicting types for " + t.subject.value, t.line);
      }
    }
  }

  std::map<std::string, Reified> reified;
  std::set<std::string> ignored;
  for (const auto& t : triples) {
    const auto& subject = t.subject.value;
    if (t.subject.kind == Term::Kind::Blank) {
      auto& r = reified[subject];
      r.line = t.line;
      if (t.predicate == rdf("subject")) r.subject = t.object.value;
      else if (t.predicate == rdf("predicate")) r.predicate = t.object.value;
      else if (t.predicate == rdf("object")) r.object = t.object.value;
      else if (t.predicate == bacnet_iri(kDiffSourcePredicate)) r.mark.source = literal_text(t);
      else if (t.predicate == bacnet_iri(kDiffProvenancePredicate)) r.mark.provenance = provenance_literal(t);
      continue;
    }
    if (headers.contains(subject)) {
      if (t.predicate == rdfs_label) out.name = literal_text(t);
      else if (t.predicate == bacnet_iri("timestamp")) out.timestamp = literal_text(t);
      else if (t.predicate == bacnet_iri("diff-source-a")) out.source_a = literal_text(t);
      else if (t.predicate == bacnet_iri("diff-source-b")) out.source_b = literal_text(t);
      continue;
    }
    auto it = out.entities.find(subject);
    if (it == out.entities.end()) {
      if (ignored.insert(subject).second) logger()->warn("line {}: ignoring untyped subject {}", t.line, subject);
      continue;
    }
    auto& entity = it->second;
    if (t.predicate == rdf_type) {
      auto local = bacnet_local(t.object.value);
      if (!local || !(*local == "Snapshot" || entity_kind_from_string(*local))) {
        entity.attributes["rdf-type"] = t.object.value;
      }
      continue;
    }
    if (t.predicate == rdfs_label) {
      entity.label = literal_text(t);
      continue;
    }
    auto local = bacnet_local(t.predicate);
    if (!local) {
      entity.attributes[t.predicate] = t.object.value;
      continue;
    }
    if (t.object.kind == Term::Kind::Literal) {
      if (*local == kDiffSourcePredicate) {
        auto& mark = out.entity_source[subject];
        mark.source = t.object.value;
        mark.line = t.line;
      } else if (*local == kDiffProvenancePredicate) {
        auto& mark = out.entity_source[subject];
        mark.provenance = provenance_literal(t);
        mark.line = t.line;
      } else {
        entity.attributes[std::string(*local)] = literal_value(t.object);
      }
      continue;
    }
    if (auto kind = edge_kind_from_string(*local); kind && t.object.kind == Term::Kind::Iri) {
      out.edges.push_back(Edge{*kind, subject, t.object.value});
    } else {
      entity.attributes[std::string(*local)] = t.object.value;
    }
  }

  for (const auto& [node, r] : reified) {
    auto local = bacnet_local(r.predicate);
    auto kind = local ? edge_kind_from_string(*local) : std::nullopt;
    if (r.subject.empty() || r.object.empty() || !kind) {
      logger()->warn("line {}: ignoring incomplete statement {}", r.line, node);
      continue;
    }
    Edge e{*kind, r.subject, r.object};
    out.edges.push_back(e);
    if (!r.mark.empty()) {
      auto& mark = out.edge_source[e];
      mark = r.mark;
      mark.line = r.line;
    }
  }
  return out;
}

NetworkGraph to_graph(Loaded& doc, std::string name) {
  std::vector<Edge> edges;
  edges.reserve(doc.edges.size());
  for (auto& e : doc.edges) {
    if (!doc.entities.contains(e.from) || !doc.entities.contains(e.to)) {
      logger()->warn("dropping {} edge {} -> {}: endpoint not in document", to_string(e.kind), e.from, e.to);
      continue;
    }
    edges.push_back(std::move(e));
  }
  std::vector<Entity> entities;
  entities.reserve(doc.entities.size());
  for (auto& [id, e] : doc.entities) entities.push_back(std::move(e));
  return NetworkGraph::from_parts(name.empty() ? doc.name : std::move(name), doc.timestamp,
                                  std::move(entities), std::move(edges));
}

} // namespace

std::string write_turtle(const NetworkGraph& g) { return write_document(g, nullptr); }

std::string write_turtle(const DiffGraph& d) { return write_document(d.graph(), &d); }

NetworkGraph read_turtle(std::string_view text, std::string name) {
  auto doc = load(text);
  return to_graph(doc, std::move(name));
}

DiffGraph read_diff_turtle(std::string_view text) {
  auto doc = load(text);
  if (!doc.source_a || !doc.source_b) {
    throw ParseError("document has no bacnet:diff-source-a / bacnet:diff-source-b header", 0);
  }
  const auto& a = *doc.source_a;
  const auto& b = *doc.source_b;
  auto classify = [&a, &b](const SourceMark& m) {
    std::optional<Provenance> by_source;
    if (m.source) {
      if (*m.source != a && *m.source != b) throw ParseError("unknown diff source '" + *m.source + "'", m.line);
      if (a != b) by_source = *m.source == a ? Provenance::Removed : Provenance::Added;
    }
    if (m.provenance) {
      if (by_source && *by_source != *m.provenance) {
        throw ParseError("diff provenance contradicts source '" + *m.source + "'", m.line);
      }
      return *m.provenance;
    }
    if (!by_source) throw ParseError("cannot tell added from removed: both diff sources are '" + a + "'", m.line);
    return *by_source;
  };

  std::map<std::string, Provenance> entity_marks;
  for (const auto& [id, mark] : doc.entity_source) entity_marks.emplace(id, classify(mark));
  std::map<Edge, Provenance> edge_marks;
  for (const auto& [edge, mark] : doc.edge_source) edge_marks.emplace(edge, classify(mark));

  auto graph = to_graph(doc, {});
  std::vector<Provenance> entity_prov;
  entity_prov.reserve(static_cast<std::size_t>(graph.num_entities()));
  for (const auto& e : graph.entities()) {
    auto it = entity_marks.find(e.id);
    entity_prov.push_back(it == entity_marks.end() ? Provenance::Unchanged : it->second);
  }
  std::vector<Provenance> edge_prov;
  edge_prov.reserve(static_cast<std::size_t>(graph.num_edges()));
  for (const auto& e : graph.edges()) {
    auto it = edge_marks.find(e);
    edge_prov.push_back(it == edge_marks.end() ? Provenance::Unchanged : it->second);
  }
  return DiffGraph::from_parts(std::move(graph), std::move(entity_prov), std::move(edge_prov), a, b);
}

} // namespace bactopo::core
