#include "./error.hpp"
#include <ostream>

namespace argmatch {

using util::join;
using util::starts_with;

ErrorCategory category_of(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::malformed_token:
    return ErrorCategory::token;
  case ErrorKind::unknown_argument:
  case ErrorKind::missing_value:
  case ErrorKind::too_many_occurrences:
  case ErrorKind::invalid_value:
  case ErrorKind::unexpected_value:
    return ErrorCategory::bind;
  case ErrorKind::missing_required:
  case ErrorKind::conflicting_arguments:
  case ErrorKind::group_requirement_unmet:
    return ErrorCategory::validation;
  }
  throw std::logic_error("Invalid error kind encountered");
}

char const *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::malformed_token: return "malformed_token";
  case ErrorKind::unknown_argument: return "unknown_argument";
  case ErrorKind::missing_value: return "missing_value";
  case ErrorKind::too_many_occurrences: return "too_many_occurrences";
  case ErrorKind::invalid_value: return "invalid_value";
  case ErrorKind::unexpected_value: return "unexpected_value";
  case ErrorKind::missing_required: return "missing_required";
  case ErrorKind::conflicting_arguments: return "conflicting_arguments";
  case ErrorKind::group_requirement_unmet: return "group_requirement_unmet";
  }
  throw std::logic_error("Invalid error kind encountered");
}

std::ostream &operator<<(std::ostream &os, ErrorKind kind) {
  return os << to_string(kind);
}

ParseError::ParseError(SpecModel spec, Details details, std::string const &message)
  : std::invalid_argument(message), spec_(std::move(spec)), details_(std::move(details))
{}

bool ParseError::operator==(ParseError const &other) const {
  auto const &a = details_;
  auto const &b = other.details_;
  return spec_.impl == other.spec_.impl && a.kind == b.kind && a.argument == b.argument &&
         a.display_name == b.display_name && a.token == b.token && a.other_argument == b.other_argument &&
         a.other_display_name == b.other_display_name && a.group == b.group && a.suggestion == b.suggestion &&
         string(what()) == other.what();
}

namespace report {

namespace {

constexpr size_t max_suggestion_distance = 2;

ParseError::Details details_for(ErrorKind kind, ArgumentSpec const &arg) {
  ParseError::Details d;
  d.kind = kind;
  d.argument = arg.key;
  d.display_name = arg.name();
  return d;
}

string describe_count(Nargs const &nargs) {
  if (nargs.min == nargs.max)
    return nargs.min == 1 ? string("expected one argument") : ("expected " + std::to_string(nargs.min) + " arguments");
  if (nargs.is_unbounded())
    return nargs.min == 1 ? string("expected at least one argument") : ("expected at least " + std::to_string(nargs.min) + " arguments");
  return "expected between " + std::to_string(nargs.min) + " and " + std::to_string(nargs.max) + " arguments";
}

} // namespace

optional<string> suggest(SpecModel const &spec, string_view input) {
  optional<string> best;
  size_t best_distance = max_suggestion_distance + 1;

  auto consider = [&](string_view candidate, string const &result) {
    auto d = util::edit_distance(input, candidate);
    // The first candidate in declaration order wins ties
    if (d > 0 && d < best_distance && d < candidate.size()) {
      best_distance = d;
      best = result;
    }
  };

  if (starts_with(input, "--")) {
    input.remove_prefix(2);
    auto eq_pos = input.find('=');
    if (eq_pos != string_view::npos)
      input = input.substr(0, eq_pos);
    for (auto const &a : spec.arguments()) {
      if (a.long_name && !a.hidden)
        consider(*a.long_name, "--" + *a.long_name);
    }
    if (spec.help_long_enabled())
      consider("help", "--help");
  } else if (!starts_with(input, "-")) {
    for (auto const &sub : spec.subcommands())
      consider(sub.name(), sub.name());
  }
  return best;
}

void malformed_token(SpecModel const &spec, string_view token, string const &reason) {
  ParseError::Details d;
  d.kind = ErrorKind::malformed_token;
  d.token = string(token);
  throw ParseError(spec, std::move(d), "malformed argument " + repr(token) + ": " + reason);
}

void unknown_argument(SpecModel const &spec, string_view token) {
  ParseError::Details d;
  d.kind = ErrorKind::unknown_argument;
  d.token = string(token);
  d.suggestion = suggest(spec, token);
  string message = "unrecognized argument " + repr(token);
  if (d.suggestion)
    message += " (did you mean " + repr(*d.suggestion) + "?)";
  throw ParseError(spec, std::move(d), message);
}

void missing_value(SpecModel const &spec, ArgumentSpec const &arg, size_t count) {
  auto d = details_for(ErrorKind::missing_value, arg);
  string message = "argument " + arg.name() + ": " + describe_count(arg.nargs);
  if (count > 0)
    message += " (got " + std::to_string(count) + ")";
  throw ParseError(spec, std::move(d), message);
}

void too_many_occurrences(SpecModel const &spec, ArgumentSpec const &arg, string_view token) {
  auto d = details_for(ErrorKind::too_many_occurrences, arg);
  d.token = string(token);
  throw ParseError(spec, std::move(d), "argument " + arg.name() + ": may only be given once");
}

void invalid_value(SpecModel const &spec, ArgumentSpec const &arg, string_view value) {
  auto d = details_for(ErrorKind::invalid_value, arg);
  d.token = string(value);
  throw ParseError(spec, std::move(d),
                   "argument " + arg.name() + ": invalid choice: " + repr(value) + " (choose from " +
                       join(", ", arg.possible_values) + ")");
}

void unexpected_value(SpecModel const &spec, ArgumentSpec const &arg, string_view value) {
  auto d = details_for(ErrorKind::unexpected_value, arg);
  d.token = string(value);
  throw ParseError(spec, std::move(d), "argument " + arg.name() + ": ignored explicit argument " + repr(value));
}

void unexpected_help_value(SpecModel const &spec, string const &flag, string_view value) {
  ParseError::Details d;
  d.kind = ErrorKind::unexpected_value;
  d.display_name = flag;
  d.token = string(value);
  throw ParseError(spec, std::move(d), "argument " + flag + ": ignored explicit argument " + repr(value));
}

void missing_required(SpecModel const &spec, vector<ArgumentSpec const *> const &missing) {
  if (missing.empty())
    throw std::logic_error("missing_required called without missing arguments");
  auto d = details_for(ErrorKind::missing_required, *missing.front());
  throw ParseError(spec, std::move(d),
                   "the following arguments are required: " +
                       join(", ", missing, [](ArgumentSpec const *a) { return a->name(); }));
}

void missing_subcommand(SpecModel const &spec) {
  ParseError::Details d;
  d.kind = ErrorKind::missing_required;
  d.display_name = "<SUBCOMMAND>";
  throw ParseError(spec, std::move(d), "the following arguments are required: <SUBCOMMAND>");
}

void conflicting_arguments(SpecModel const &spec, Group const &group, ArgumentSpec const &first, ArgumentSpec const &second) {
  auto d = details_for(ErrorKind::conflicting_arguments, first);
  d.other_argument = second.key;
  d.other_display_name = second.name();
  d.group = group.id;
  throw ParseError(spec, std::move(d), "argument " + second.name() + ": not allowed with argument " + first.name());
}

void requirement_unmet(SpecModel const &spec, Group const &group, ArgumentSpec const &present, ArgumentSpec const &absent) {
  auto d = details_for(ErrorKind::group_requirement_unmet, present);
  d.other_argument = absent.key;
  d.other_display_name = absent.name();
  d.group = group.id;
  throw ParseError(spec, std::move(d), "argument " + present.name() + ": requires argument " + absent.name());
}

void one_required_unmet(SpecModel const &spec, Group const &group) {
  ParseError::Details d;
  d.kind = ErrorKind::group_requirement_unmet;
  d.group = group.id;
  auto const &args = spec.arguments();
  throw ParseError(spec, std::move(d),
                   "one of the arguments " +
                       join(" ", group.members, [&](size_t i) { return args[i].name(); }) +
                       " is required");
}

} // namespace argmatch::report

} // namespace argmatch
