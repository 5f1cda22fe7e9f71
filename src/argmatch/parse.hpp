#ifndef HEADER_GUARD_6eb9f4a9fd2f74d5f6135944ed5ec02b
#define HEADER_GUARD_6eb9f4a9fd2f74d5f6135944ed5ec02b

#include "./binding.hpp"
#include "./error.hpp"
#include "./spec.hpp"

namespace argmatch {

/**
 * \brief Parses a list of arguments
 *
 * Each level binds its own input first; the remaining input after a subcommand name is bound against that subcommand.  Once the whole input is bound, validation proceeds from the outermost level inward and stops at the first failing level.
 *
 * \param args The arguments, excluding the program name
 * \param params Formatting parameters used for the text of \ref HelpRequested
 * \throws ParseError on failure
 * \throws HelpRequested if help was requested at any level
 **/
Binding try_parse(SpecModel const &spec, vector<string_view> const &args, HelpFormatterParameters const &params = {});

/**
 * \brief Parses the command line of \p main
 *
 * \p argv[0] is skipped; if neither \p params nor \p spec specify a program name, it is used as the program name in help text.
 * \throws ParseError on failure
 * \throws HelpRequested if help was requested at any level
 **/
Binding try_parse(SpecModel const &spec, int argc, char **argv, HelpFormatterParameters params = {});

/**
 * \brief Result of \ref parse: a Binding, a help request, or an error
 **/
class ParseOutcome {
public:
  enum class Kind {
    matched,
    help_requested,
    failed,
  };

  explicit ParseOutcome(Binding binding)
    : kind_(Kind::matched), binding_(std::move(binding))
  {}
  explicit ParseOutcome(HelpRequested const &help)
    : kind_(Kind::help_requested), help_spec_(help.spec()), help_text_(help.text())
  {}
  explicit ParseOutcome(ParseError const &error)
    : kind_(Kind::failed), error_(error)
  {}

  Kind kind() const { return kind_; }

  /**
   * \brief Indicates if the input was matched successfully
   **/
  explicit operator bool () const { return kind_ == Kind::matched; }

  Binding const &binding() const { return binding_; }

  /**
   * \brief The level whose help was requested, if \ref kind is Kind::help_requested
   **/
  SpecModel const &help_spec() const { return help_spec_; }
  string const &help_text() const { return help_text_; }

  optional<ParseError> const &error() const { return error_; }

private:
  Kind kind_;
  Binding binding_;
  SpecModel help_spec_;
  string help_text_;
  optional<ParseError> error_;
};

/**
 * \brief Parses a list of arguments without throwing for errors in the input
 **/
ParseOutcome parse(SpecModel const &spec, vector<string_view> const &args, HelpFormatterParameters const &params = {});

ParseOutcome parse(SpecModel const &spec, int argc, char **argv, HelpFormatterParameters const &params = {});

} // namespace argmatch

#endif /* HEADER GUARD */
