#include "./matcher.hpp"
#include "./error.hpp"

namespace argmatch {

Matcher::Matcher(SpecModel const &spec, vector<string_view> const &input, size_t start,
                 HelpFormatterParameters const &params)
  : spec(spec), params(params), tokens(this->spec, input, start),
    positional_counts(spec.positionals().size(), 0)
{}

LevelMatch Matcher::run() {
  while (!tokens.at_end()) {
    Token token = tokens.next();

    switch (token.kind) {
    case TokenKind::end_of_options:
      end_of_options = true;
      break;
    case TokenKind::short_flag:
    case TokenKind::long_flag:
    case TokenKind::value_joined:
      consume_flag(token);
      break;
    case TokenKind::positional:
    case TokenKind::bare:
      if (!end_of_options && token.value == "help" && spec.help_subcommand_enabled())
        request_subcommand_help();
      if (!end_of_options && !needs_positional()) {
        if (auto sub = spec.find_subcommand(token.value)) {
          // Everything after the subcommand name belongs to the subcommand
          result.subcommand = sub;
          result.subcommand_start = token.arg_index + 1;
          check_positional_counts();
          apply_defaults(spec, result.binding);
          return std::move(result);
        }
      }
      consume_value(token);
      break;
    }
  }

  check_positional_counts();
  apply_defaults(spec, result.binding);
  return std::move(result);
}

void Matcher::request_help() {
  throw HelpRequested(spec, spec.help_string(params));
}

void Matcher::request_subcommand_help() {
  SpecModel target = spec;

  // "help a b" shows the help of subcommand b of subcommand a
  while (auto next = tokens.peek()) {
    if (!next->is_value())
      break;
    auto sub = target.find_subcommand(next->value);
    if (!sub)
      report::unknown_argument(target, next->value);
    target = *sub;
    tokens.next();
  }
  throw HelpRequested(target, target.help_string(params));
}

void Matcher::consume_flag(Token const &token) {
  if (token.is_short ? (token.name == "h" && spec.help_short_enabled())
                     : (token.name == "help" && spec.help_long_enabled())) {
    if (token.kind == TokenKind::value_joined)
      report::unexpected_help_value(spec, token.is_short ? string("-h") : string("--help"), token.value);
    request_help();
  }

  ArgumentSpec const *arg = token.is_short ? spec.find_short(token.name[0]) : spec.find_long(token.name);
  if (!arg)
    report::unknown_argument(spec, token.text);

  if (result.binding.occurrences_of(arg->key) > 0 && !arg->multiple)
    report::too_many_occurrences(spec, *arg, token.text);

  if (!arg->takes_value()) {
    if (token.kind == TokenKind::value_joined)
      report::unexpected_value(spec, *arg, token.value);
    ++result.binding.entry(arg->key).occurrences;
    return;
  }

  vector<string> values;
  if (token.kind == TokenKind::value_joined) {
    values.push_back(token.value);
  } else {
    // Values stop at the next flag, at "--", and at the end of input
    while (values.size() < arg->nargs.max) {
      auto next = tokens.peek();
      if (!next || !next->is_value())
        break;
      values.push_back(tokens.next().value);
    }
  }

  if (values.size() < arg->nargs.min)
    report::missing_value(spec, *arg, values.size());

  for (auto const &v : values) {
    if (!arg->accepts(v))
      report::invalid_value(spec, *arg, v);
  }

  auto &entry = result.binding.entry(arg->key);
  entry.values.insert(entry.values.end(), values.begin(), values.end());
  ++entry.occurrences;
}

void Matcher::consume_value(Token const &token) {
  auto const &positionals = spec.positionals();
  if (positional_index >= positionals.size())
    report::unknown_argument(spec, token.value);

  auto const &arg = *positionals[positional_index];
  if (!arg.accepts(token.value))
    report::invalid_value(spec, arg, token.value);

  auto &entry = result.binding.entry(arg.key);
  entry.values.push_back(token.value);
  ++entry.occurrences;

  if (++positional_counts[positional_index] == arg.nargs.max)
    ++positional_index;
}

bool Matcher::needs_positional() const {
  auto const &positionals = spec.positionals();
  for (size_t i = positional_index; i < positionals.size(); ++i) {
    auto const &arg = *positionals[i];
    auto count = positional_counts[i];
    if ((arg.required || count > 0) && count < arg.nargs.min)
      return true;
  }
  return false;
}

void Matcher::check_positional_counts() const {
  auto const &positionals = spec.positionals();
  for (size_t i = 0; i < positionals.size(); ++i) {
    auto count = positional_counts[i];
    if (count > 0 && count < positionals[i]->nargs.min)
      report::missing_value(spec, *positionals[i], count);
  }
}

void apply_defaults(SpecModel const &spec, Binding &binding) {
  for (auto const &a : spec.arguments()) {
    if (!a.default_value || binding.occurrences_of(a.key) > 0)
      continue;
    auto &entry = binding.entry(a.key);
    entry.values.assign(1, *a.default_value);
    entry.source = ValueSource::default_value;
  }
}

LevelMatch match_level(SpecModel const &spec, vector<string_view> const &input, size_t start,
                       HelpFormatterParameters const &params) {
  return Matcher(spec, input, start, params).run();
}

} // namespace argmatch
