#ifndef HEADER_GUARD_b1d697506088e0476361eb462b1c7408
#define HEADER_GUARD_b1d697506088e0476361eb462b1c7408

#include "./binding.hpp"
#include "./spec.hpp"
#include "./tokenizer.hpp"

namespace argmatch {

/**
 * \brief Outcome of binding the input of a single level
 **/
struct LevelMatch {
  Binding binding;

  /**
   * \brief The matched subcommand level, or nullptr.  Points into the subcommands of the level that was matched.
   **/
  SpecModel const *subcommand = nullptr;

  /**
   * \brief Index of the first input string belonging to \ref subcommand
   **/
  size_t subcommand_start = 0;
};

/**
 * \brief Binds the input of one level to its declared arguments in a single left-to-right pass.
 *
 * Binding stops at the first bare token naming a subcommand; the remaining input belongs to that subcommand.  Defaults are applied once the input of the level is exhausted.
 **/
class Matcher {
public:
  Matcher(SpecModel const &spec, vector<string_view> const &input, size_t start = 0,
          HelpFormatterParameters const &params = {});

  /**
   * \throws ParseError on token and bind errors
   * \throws HelpRequested if \p -h, \p --help or \p help was given
   **/
  LevelMatch run();

private:
  void consume_flag(Token const &token);
  void consume_value(Token const &token);
  [[noreturn]] void request_help();
  [[noreturn]] void request_subcommand_help();

  /**
   * \brief Indicates if a positional still needs values before a bare token may name a subcommand
   **/
  bool needs_positional() const;

  void check_positional_counts() const;

  SpecModel spec;
  HelpFormatterParameters params;
  Tokenizer tokens;
  LevelMatch result;
  bool end_of_options = false;

  /**
   * \brief Next positional slot to fill, and the number of values each slot received
   **/
  size_t positional_index = 0;
  vector<size_t> positional_counts;
};

/**
 * \brief Adds the declared default of every argument that did not occur
 **/
void apply_defaults(SpecModel const &spec, Binding &binding);

/**
 * \brief Convenience wrapper constructing a \ref Matcher and running it
 **/
LevelMatch match_level(SpecModel const &spec, vector<string_view> const &input, size_t start = 0,
                       HelpFormatterParameters const &params = {});

} // namespace argmatch

#endif /* HEADER GUARD */
