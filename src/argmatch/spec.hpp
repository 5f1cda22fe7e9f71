#ifndef HEADER_GUARD_4113281f6fe11cb2c95623d73bb84115
#define HEADER_GUARD_4113281f6fe11cb2c95623d73bb84115

#include "./common.hpp"

#include <limits>
#include <stdexcept>
#include <unordered_map>

namespace argmatch {

/**
 * \brief Marks an arity without an upper bound
 **/
constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

/**
 * \brief Symbolic arity constraints
 **/
enum NargsValue : int {
  /**
   * \brief Matches zero or one value.
   **/
  OPTIONAL = -1,
  /**
   * \brief Matches any number of values, including zero.
   **/
  ZERO_OR_MORE = -2,
  /**
   * \brief Matches one or more values.
   **/
  ONE_OR_MORE = -3,
};

/**
 * \brief Specifies how many values a single occurrence of an argument consumes.
 * \details Constraints may be specified either symbolically using a \ref NargsValue constant, as an exact number of values, or as a closed range.
 **/
struct Nargs {
  size_t min = 1, max = 1;

  /**
   * \brief Exactly one value
   **/
  Nargs() = default;

  /**
   * \brief Specify a symbolic constraint using a \ref NargsValue constant
   **/
  Nargs(NargsValue value);

  /**
   * \brief Specify that exactly \p count values must be matched
   *
   * Only flags may have a count of zero.
   **/
  Nargs(int count);

  /**
   * \brief Specify that between \p min and \p max values (inclusive) must be matched
   **/
  Nargs(size_t min, size_t max);

  bool is_unbounded() const { return max == UNBOUNDED; }

  bool operator==(Nargs const &other) const { return min == other.min && max == other.max; }
  bool operator!=(Nargs const &other) const { return !(*this == other); }
};

enum class ArgKind {
  /**
   * \brief Zero-arity switch; presence alone is the signal
   **/
  flag,
  /**
   * \brief Named argument consuming one or more values
   **/
  option,
  /**
   * \brief Argument identified by its position
   **/
  positional,
};

enum class GroupKind {
  /**
   * \brief At most one member may be present
   **/
  conflict,
  /**
   * \brief If any member is present, every target must be present as well
   **/
  requirement,
  /**
   * \brief At least one member must be present
   **/
  one_required,
};

/**
 * \brief Fully resolved description of a single declared argument
 *
 * Instances are only produced by \ref build_spec, and never change afterwards.
 **/
struct ArgumentSpec {
  /**
   * \brief Identity used to look up results in a \ref Binding
   **/
  string key;
  ArgKind kind = ArgKind::flag;
  optional<char> short_name;
  optional<string> long_name;
  Nargs nargs;
  bool required = false;
  bool multiple = false;
  bool hidden = false;
  optional<string> default_value;

  /**
   * \brief Closed set of accepted values.  Empty means any value is accepted.
   **/
  vector<string> possible_values;

  string help;
  string value_name;

  /**
   * \brief 1-based index among the positional arguments of the same level, or 0 for flags and options
   **/
  size_t index = 0;

  /**
   * \brief Ids of the groups this argument is a member or target of
   **/
  vector<string> groups;

  bool is_positional() const { return kind == ArgKind::positional; }
  bool takes_value() const { return nargs.max > 0; }

  /**
   * \brief Name used in diagnostics: the long form if declared, then the short form, then the placeholder.
   **/
  string name() const;

  /**
   * \brief Placeholder for the value(s) in help and usage messages
   **/
  string format_metavar() const;

  bool accepts(string_view value) const;
};

/**
 * \brief Declared relationship among arguments of the same level
 **/
struct Group {
  string id;
  GroupKind kind = GroupKind::conflict;
  /**
   * \brief Indices into \ref SpecModel::arguments, in declaration order
   **/
  vector<size_t> members;
  /**
   * \brief For \ref GroupKind::requirement only: the arguments required by any present member
   **/
  vector<size_t> targets;
};

/**
 * \brief Builder for a single argument declaration
 **/
class ArgumentDecl {
public:

  /**
   * \brief Declare a zero-arity switch with result key \p key
   **/
  static ArgumentDecl flag(string key);

  /**
   * \brief Declare a named argument that takes one value by default
   **/
  static ArgumentDecl option(string key);

  /**
   * \brief Declare a positional argument that takes one value by default
   **/
  static ArgumentDecl positional(string key);

  ArgumentDecl &short_name(char c);
  ArgumentDecl &long_name(string name);
  ArgumentDecl &help(string text);

  /**
   * \brief Hide this argument from the help and usage messages
   **/
  ArgumentDecl &hidden(bool value = true);
  ArgumentDecl &required(bool value = true);

  /**
   * \brief Allow the argument to occur more than once.  For positionals this makes the arity unbounded unless \ref nargs is also given.
   **/
  ArgumentDecl &multiple(bool value = true);
  ArgumentDecl &nargs(Nargs value);
  ArgumentDecl &default_value(string value);
  ArgumentDecl &possible_values(StringList values);

  /**
   * \brief Placeholder shown in help and usage messages instead of the upper-cased key
   **/
  ArgumentDecl &value_name(string name);

  /**
   * \brief Explicit 1-based position of a positional argument
   **/
  ArgumentDecl &index(size_t value);

  /**
   * \brief Shorthand for a two-member conflict group
   **/
  ArgumentDecl &conflicts_with(string key);

  /**
   * \brief Shorthand for a requirement group triggered by this argument
   **/
  ArgumentDecl &requires_arg(string key);

  ArgumentSpec const &spec() const { return spec_; }
  bool has_explicit_nargs() const { return explicit_nargs_; }
  vector<string> const &conflicts() const { return conflicts_; }
  vector<string> const &requirements() const { return requirements_; }

private:
  explicit ArgumentDecl(string key, ArgKind kind);

  ArgumentSpec spec_;
  bool explicit_nargs_ = false;
  vector<string> conflicts_;
  vector<string> requirements_;
};

/**
 * \brief Declaration of a group of arguments
 **/
struct GroupDecl {
  string id;
  GroupKind kind = GroupKind::conflict;
  vector<string> members;
  vector<string> targets;

  static GroupDecl conflict(string id, StringList members);
  static GroupDecl requirement(string id, StringList members, StringList targets);
  static GroupDecl one_required(string id, StringList members);
};

/**
 * \brief Per-level parsing behavior
 **/
struct Settings {
  /**
   * \brief Treat tokens such as \p -1 or \p -.5 as values rather than unknown flags.
   *
   * This has no effect if a short flag of this level is itself a digit.
   **/
  bool allow_negative_numbers = false;

  /**
   * \brief Do not recognize \p -h and \p --help automatically
   **/
  bool disable_help_flag = false;

  /**
   * \brief Do not recognize \p help \p <name> automatically
   **/
  bool disable_help_subcommand = false;

  /**
   * \brief Fail if the level declares subcommands but none was given
   **/
  bool subcommand_required = false;
};

/**
 * \brief Complete, unvalidated description of one command level
 *
 * This is the input to \ref build_spec.  Subcommands are nested Declarations.
 **/
class Declarations {
public:
  explicit Declarations(string name = {});

  Declarations &description(string s);
  Declarations &epilog(string s);

  /**
   * \brief Specify an explicit usage string to use in place of the automatically-generated one.
   **/
  Declarations &usage(string s);

  /**
   * \brief Alternative name under which this subcommand is also matched
   **/
  Declarations &alias(string name);
  Declarations &settings(Settings value);
  Declarations &arg(ArgumentDecl decl);
  Declarations &group(GroupDecl decl);
  Declarations &subcommand(Declarations decl);

  string const &name() const { return name_; }
  string const &description() const { return description_; }
  string const &epilog() const { return epilog_; }
  optional<string> const &usage() const { return usage_; }
  vector<string> const &aliases() const { return aliases_; }
  Settings const &settings() const { return settings_; }
  vector<ArgumentDecl> const &arguments() const { return arguments_; }
  vector<GroupDecl> const &groups() const { return groups_; }
  vector<Declarations> const &subcommands() const { return subcommands_; }

private:
  string name_;
  string description_;
  string epilog_;
  optional<string> usage_;
  vector<string> aliases_;
  Settings settings_;
  vector<ArgumentDecl> arguments_;
  vector<GroupDecl> groups_;
  vector<Declarations> subcommands_;
};

/**
 * \brief Specifies formatting parameters for help text
 **/
struct HelpFormatterParameters {
  /**
   * \brief Use default values for all parameters.
   **/
  HelpFormatterParameters() = default;

  /**
   * \brief Specify just the line length, using default values of all other parameters.
   **/
  HelpFormatterParameters(int width) : width(width) {}

  /**
   * \brief Program name for usage information.
   *
   * If empty, defaults to the name chain of the \ref SpecModel.
   **/
  string prog;

  /**
   * \brief Amount to indent help sections
   **/
  int indent_increment = 2;

  /**
   * \brief Maximum amount to indent help text
   * If argument invocations are longer than this amount, the invocation will be listed on a separate line.
   **/
  int max_help_position = 24;

  /**
   * \brief Maximum line length for word wrapping
   *
   * If not specified (i.e. set to 0), and STDIN is a terminal, defaults to the terminal width.  Otherwise, defaults to 80.
   **/
  int width = 0;

  /**
   * \brief Lower bound on the line length for word wrapping help text
   **/
  int min_text_width = 11;
};

/**
 * \brief Kinds of construction-time failures
 **/
enum class ConfigErrorKind {
  duplicate_identity,
  unknown_group_member,
  invalid_positional_ordering,
  invalid_declaration,
};

/**
 * \brief Exception representing an invalid set of declarations
 *
 * This is a programming error, never caused by command-line input.
 **/
class ConfigError : public std::logic_error {
  ConfigErrorKind kind_;
public:
  ConfigError(ConfigErrorKind kind, std::string const &message)
    : std::logic_error(message), kind_(kind)
  {}

  ConfigErrorKind kind() const { return kind_; }
};

/**
 * \brief Immutable, validated description of one command level and its subcommands
 *
 * SpecModel is a cheap handle; copies share the same underlying model.  Child levels are owned by their parent, and hold only a weak reference back to it.
 **/
class SpecModel {
public:

  /**
   * \brief Opaque implementation data.
   **/
  struct Impl;

  SpecModel() = default;
  explicit SpecModel(shared_ptr<Impl const> impl)
    : impl(std::move(impl))
  {}

  explicit operator bool () const { return bool(impl); }

  string const &name() const;

  /**
   * \brief Name of this level prefixed by the names of all enclosing levels
   **/
  string prog() const;

  string const &description() const;
  string const &epilog() const;
  optional<string> const &usage() const;
  vector<string> const &aliases() const;
  Settings const &settings() const;

  /**
   * \brief All arguments, in declaration order
   **/
  vector<ArgumentSpec> const &arguments() const;

  /**
   * \brief Positional arguments, ordered by index
   **/
  vector<ArgumentSpec const *> const &positionals() const;

  vector<Group> const &groups() const;
  vector<SpecModel> const &subcommands() const;

  ArgumentSpec const *find_key(string_view key) const;
  ArgumentSpec const *find_short(char c) const;
  ArgumentSpec const *find_long(string_view name) const;

  /**
   * \brief Look up a subcommand by name or alias
   **/
  SpecModel const *find_subcommand(string_view name) const;

  /**
   * \returns The enclosing level, or an empty handle for the root
   **/
  SpecModel parent() const;

  bool help_short_enabled() const;
  bool help_long_enabled() const;
  bool help_subcommand_enabled() const;

  /**
   * \returns The usage message
   **/
  string usage_string(HelpFormatterParameters const &params = {}) const;

  /**
   * \returns The help message
   **/
  string help_string(HelpFormatterParameters const &params = {}) const;

  shared_ptr<Impl const> impl;
};

/**
 * \brief Validates \p declarations and builds the immutable model
 * \throws ConfigError if the declarations are inconsistent
 * \related SpecModel
 **/
SpecModel build_spec(Declarations const &declarations);

} // namespace argmatch

#endif /* HEADER GUARD */
