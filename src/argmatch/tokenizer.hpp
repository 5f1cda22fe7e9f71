#ifndef HEADER_GUARD_19c8d41c59efea0e3d5d3005331d289f
#define HEADER_GUARD_19c8d41c59efea0e3d5d3005331d289f

#include "./spec.hpp"

#include <deque>
#include <iosfwd>

namespace argmatch {

enum class TokenKind {
  short_flag,
  long_flag,
  /**
   * \brief A flag with its value attached, as in \p --name=value, \p -n5 or \p -n=5
   **/
  value_joined,
  /**
   * \brief A plain string the level still expects as a positional or option value
   **/
  positional,
  end_of_options,
  /**
   * \brief A plain string beyond the expected positionals: a subcommand name or an error
   **/
  bare,
};

char const *to_string(TokenKind kind);

/**
 * \brief Classified unit of command-line input
 **/
struct Token {
  TokenKind kind = TokenKind::bare;

  /**
   * \brief Flag identity without prefix characters: one character for short flags, the long name otherwise.  Unresolved identities are kept as written.
   **/
  string name;

  /**
   * \brief Attached value for \ref TokenKind::value_joined, or the text of a positional/bare token
   **/
  string value;

  /**
   * \brief The flag as written (\p -v, \p --name), or the plain string
   **/
  string text;

  /**
   * \brief Index of the input string this token was produced from
   **/
  size_t arg_index = 0;

  /**
   * \brief Set for tokens produced from a single-dash string
   **/
  bool is_short = false;

  bool is_value() const { return kind == TokenKind::positional || kind == TokenKind::bare; }

  bool operator==(Token const &other) const;
  bool operator!=(Token const &other) const { return !(*this == other); }
};

std::ostream &operator<<(std::ostream &os, Token const &token);

/**
 * \brief Splits input strings into tokens against the identities declared by one level.
 *
 * Tokens are produced on demand, one input string at a time, so that the matcher can hand the unconsumed input to a subcommand level which tokenizes it against its own declarations.
 **/
class Tokenizer {
public:
  Tokenizer(SpecModel const &spec, vector<string_view> const &input, size_t start = 0);

  /**
   * \returns The next token without consuming it, or nullptr at the end of input
   * \throws ParseError with ErrorKind::malformed_token
   **/
  Token const *peek();

  /**
   * \pre peek() != nullptr
   **/
  Token next();

  bool at_end();

private:
  void fill();
  void classify_value(string_view arg);
  bool is_negative_number(string_view arg) const;

  SpecModel spec;
  vector<string_view> const &input;
  size_t arg_index;
  std::deque<Token> pending;
  bool end_of_options_ = false;

  /**
   * \brief Values still wanted by the most recent value-taking flag
   **/
  size_t flag_values_wanted = 0;

  /**
   * \brief Values still wanted by the positional arguments
   **/
  size_t positional_values_wanted = 0;

  bool has_negative_number_options = false;
};

/**
 * \brief Tokenizes all of \p input against \p spec
 * \throws ParseError with ErrorKind::malformed_token
 **/
vector<Token> tokenize(SpecModel const &spec, vector<string_view> const &input);

} // namespace argmatch

#endif /* HEADER GUARD */
