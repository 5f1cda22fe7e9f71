#include "./tokenizer.hpp"
#include "./error.hpp"
#include <cctype>
#include <ostream>
#include <regex>

namespace argmatch {

using util::starts_with;

char const *to_string(TokenKind kind) {
  switch (kind) {
  case TokenKind::short_flag: return "short_flag";
  case TokenKind::long_flag: return "long_flag";
  case TokenKind::value_joined: return "value_joined";
  case TokenKind::positional: return "positional";
  case TokenKind::end_of_options: return "end_of_options";
  case TokenKind::bare: return "bare";
  }
  throw std::logic_error("Invalid token kind encountered");
}

bool Token::operator==(Token const &other) const {
  return kind == other.kind && name == other.name && value == other.value && text == other.text &&
         arg_index == other.arg_index && is_short == other.is_short;
}

std::ostream &operator<<(std::ostream &os, Token const &token) {
  os << to_string(token.kind) << '(' << repr(token.text);
  if (token.kind == TokenKind::value_joined)
    os << ", " << repr(token.value);
  return os << ')';
}

namespace {

std::regex const negative_number_re { R"RE(^-\d+$|^-\d*\.\d+$)RE" };

size_t saturating_add(size_t a, size_t b) {
  return (a > UNBOUNDED - b) ? UNBOUNDED : a + b;
}

} // namespace

Tokenizer::Tokenizer(SpecModel const &spec, vector<string_view> const &input, size_t start)
  : spec(spec), input(input), arg_index(start) {
  for (auto p : spec.positionals())
    positional_values_wanted = saturating_add(positional_values_wanted, p->nargs.max);

  for (auto const &a : spec.arguments()) {
    if (a.short_name && std::isdigit(static_cast<unsigned char>(*a.short_name)))
      has_negative_number_options = true;
  }
}

bool Tokenizer::is_negative_number(string_view arg) const {
  if (!spec.settings().allow_negative_numbers || has_negative_number_options)
    return false;
  return std::regex_search(arg.begin(), arg.end(), negative_number_re);
}

Token const *Tokenizer::peek() {
  if (pending.empty())
    fill();
  if (pending.empty())
    return nullptr;
  return &pending.front();
}

Token Tokenizer::next() {
  if (!peek())
    throw std::logic_error("Tokenizer::next called at end of input");
  Token t = std::move(pending.front());
  pending.pop_front();
  return t;
}

bool Tokenizer::at_end() {
  return peek() == nullptr;
}

void Tokenizer::classify_value(string_view arg) {
  Token t;
  t.value = string(arg);
  t.text = string(arg);
  t.arg_index = arg_index;

  if (flag_values_wanted > 0 && !end_of_options_) {
    // Option values are plain strings; they do not count against the positionals
    t.kind = TokenKind::positional;
    if (flag_values_wanted != UNBOUNDED)
      --flag_values_wanted;
  } else if (positional_values_wanted > 0) {
    t.kind = TokenKind::positional;
    if (positional_values_wanted != UNBOUNDED)
      --positional_values_wanted;
  } else {
    t.kind = TokenKind::bare;
  }
  pending.push_back(std::move(t));
}

void Tokenizer::fill() {
  if (arg_index >= input.size())
    return;

  string_view arg = input[arg_index];

  if (end_of_options_) {
    classify_value(arg);
    ++arg_index;
    return;
  }

  if (arg == "--") {
    Token t;
    t.kind = TokenKind::end_of_options;
    t.text = string(arg);
    t.arg_index = arg_index;
    pending.push_back(std::move(t));
    end_of_options_ = true;
    flag_values_wanted = 0;
    ++arg_index;
    return;
  }

  if (starts_with(arg, "--")) {
    string_view body = arg.substr(2);
    Token t;
    t.arg_index = arg_index;
    auto eq_pos = body.find('=');
    if (eq_pos != string_view::npos) {
      if (eq_pos == 0)
        report::malformed_token(spec, arg, "missing option name before '='");
      t.kind = TokenKind::value_joined;
      t.name = string(body.substr(0, eq_pos));
      t.value = string(body.substr(eq_pos + 1));
      t.text = "--" + t.name;
      flag_values_wanted = 0;
    } else {
      t.kind = TokenKind::long_flag;
      t.name = string(body);
      t.text = string(arg);
      auto a = spec.find_long(body);
      flag_values_wanted = (a && a->takes_value()) ? a->nargs.max : 0;
    }
    pending.push_back(std::move(t));
    ++arg_index;
    return;
  }

  // A lone "-" conventionally names standard input and is a plain value
  if (arg.size() < 2 || arg[0] != '-' || is_negative_number(arg)) {
    classify_value(arg);
    ++arg_index;
    return;
  }

  flag_values_wanted = 0;
  for (size_t j = 1; j < arg.size(); ++j) {
    char c = arg[j];
    if (c == '=')
      report::malformed_token(spec, arg, "missing option name before '='");

    Token t;
    t.arg_index = arg_index;
    t.is_short = true;
    t.name = string(1, c);
    t.text = "-" + t.name;

    auto a = spec.find_short(c);
    string_view rest = arg.substr(j + 1);
    bool explicit_eq = !rest.empty() && rest[0] == '=';

    if ((a && a->takes_value()) || explicit_eq) {
      // The remainder of the string is the value, and clustering stops here
      if (explicit_eq)
        rest.remove_prefix(1);
      if (!rest.empty() || explicit_eq) {
        t.kind = TokenKind::value_joined;
        t.value = string(rest);
      } else {
        t.kind = TokenKind::short_flag;
        flag_values_wanted = a->nargs.max;
      }
      pending.push_back(std::move(t));
      break;
    }

    t.kind = TokenKind::short_flag;
    pending.push_back(std::move(t));
  }
  ++arg_index;
}

vector<Token> tokenize(SpecModel const &spec, vector<string_view> const &input) {
  vector<Token> result;
  Tokenizer tokenizer(spec, input);
  while (!tokenizer.at_end())
    result.push_back(tokenizer.next());
  return result;
}

} // namespace argmatch
