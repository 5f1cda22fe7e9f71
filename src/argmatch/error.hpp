#ifndef HEADER_GUARD_4cc5095520d337ccf5842ae8e3176835
#define HEADER_GUARD_4cc5095520d337ccf5842ae8e3176835

#include "./spec.hpp"

#include <iosfwd>

namespace argmatch {

/**
 * \brief Kinds of parse-time failures
 **/
enum class ErrorKind {
  // TokenError
  malformed_token,

  // BindError
  unknown_argument,
  missing_value,
  too_many_occurrences,
  invalid_value,
  unexpected_value,

  // ValidationError
  missing_required,
  conflicting_arguments,
  group_requirement_unmet,
};

enum class ErrorCategory {
  token,
  bind,
  validation,
};

ErrorCategory category_of(ErrorKind kind);

/**
 * \returns A stable lower-case name such as \p "missing_required"
 **/
char const *to_string(ErrorKind kind);

std::ostream &operator<<(std::ostream &os, ErrorKind kind);

/**
 * \brief Exception representing a command-line parsing error
 *
 * The error always refers to the command level at which it was detected.
 **/
class ParseError : public std::invalid_argument {
public:

  /**
   * \brief Structured description of the error, alongside the human-readable message
   **/
  struct Details {
    ErrorKind kind = ErrorKind::unknown_argument;

    /**
     * \brief Key of the offending argument, if the error concerns a declared argument
     **/
    string argument;

    /**
     * \brief Display form of the offending argument, e.g. \p --name or \p <FILE>
     **/
    string display_name;

    /**
     * \brief Offending command-line text, if the error concerns a specific token
     **/
    string token;

    /**
     * \brief Second argument involved (conflicts and requirements)
     **/
    string other_argument;
    string other_display_name;

    /**
     * \brief Id of the violated group
     **/
    string group;

    /**
     * \brief Nearest known identity (for unknown arguments), if one is close enough
     **/
    optional<string> suggestion;
  };

  ParseError(SpecModel spec, Details details, std::string const &message);

  ErrorKind kind() const { return details_.kind; }
  ErrorCategory category() const { return category_of(details_.kind); }
  string const &argument() const { return details_.argument; }
  string const &display_name() const { return details_.display_name; }
  string const &token() const { return details_.token; }
  string const &other_argument() const { return details_.other_argument; }
  string const &group() const { return details_.group; }
  optional<string> const &suggestion() const { return details_.suggestion; }
  Details const &details() const { return details_; }

  /**
   * \return The command level at which the error occurred
   **/
  SpecModel const &spec() const { return spec_; }

  bool operator==(ParseError const &other) const;
  bool operator!=(ParseError const &other) const { return !(*this == other); }

private:
  SpecModel spec_;
  Details details_;
};

/**
 * \brief Signals that help output was requested instead of a normal parse
 **/
class HelpRequested : public std::exception {
  SpecModel spec_;
  string text_;
public:
  HelpRequested(SpecModel spec, string text)
    : spec_(std::move(spec)), text_(std::move(text))
  {}

  /**
   * \return The command level whose help was requested
   **/
  SpecModel const &spec() const { return spec_; }
  string const &text() const { return text_; }
  char const *what() const noexcept override { return text_.c_str(); }
};

/**
 * \brief Error reporting helpers used by the matching and validation phases
 **/
namespace report {

/**
 * \brief Finds the declared identity nearest to \p input, if within a small edit distance
 *
 * Long flags (\p --name) are compared against the long names of \p spec, bare words against its subcommand names.  Single-character flags never produce a suggestion.
 **/
optional<string> suggest(SpecModel const &spec, string_view input);

[[noreturn]] void malformed_token(SpecModel const &spec, string_view token, string const &reason);
[[noreturn]] void unknown_argument(SpecModel const &spec, string_view token);
[[noreturn]] void missing_value(SpecModel const &spec, ArgumentSpec const &arg, size_t count);
[[noreturn]] void too_many_occurrences(SpecModel const &spec, ArgumentSpec const &arg, string_view token);
[[noreturn]] void invalid_value(SpecModel const &spec, ArgumentSpec const &arg, string_view value);
[[noreturn]] void unexpected_value(SpecModel const &spec, ArgumentSpec const &arg, string_view value);

/**
 * \brief Reports a value joined to the automatic help flag \p flag
 **/
[[noreturn]] void unexpected_help_value(SpecModel const &spec, string const &flag, string_view value);
[[noreturn]] void missing_required(SpecModel const &spec, vector<ArgumentSpec const *> const &missing);
[[noreturn]] void missing_subcommand(SpecModel const &spec);
[[noreturn]] void conflicting_arguments(SpecModel const &spec, Group const &group, ArgumentSpec const &first, ArgumentSpec const &second);
[[noreturn]] void requirement_unmet(SpecModel const &spec, Group const &group, ArgumentSpec const &present, ArgumentSpec const &absent);
[[noreturn]] void one_required_unmet(SpecModel const &spec, Group const &group);

} // namespace argmatch::report

} // namespace argmatch

#endif /* HEADER GUARD */
