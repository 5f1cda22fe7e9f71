#ifndef HEADER_GUARD_aeb550f8104a5789edb1c40a9b7731cb
#define HEADER_GUARD_aeb550f8104a5789edb1c40a9b7731cb

#include "./common.hpp"

#include <boost/lexical_cast.hpp>

#include <iosfwd>
#include <map>
#include <typeinfo>

namespace argmatch {

/**
 * \brief Where the values of a bound argument came from
 **/
enum class ValueSource {
  command_line,
  default_value,
};

/**
 * \brief Values and occurrence count of a single argument
 **/
struct ArgMatch {
  vector<string> values;
  size_t occurrences = 0;
  ValueSource source = ValueSource::command_line;

  bool operator==(ArgMatch const &other) const {
    return values == other.values && occurrences == other.occurrences && source == other.source;
  }
  bool operator!=(ArgMatch const &other) const { return !(*this == other); }
};

namespace detail {

[[noreturn]] void handle_type_conversion_failure(const char *name, string_view key, string_view s);

template <class T>
T lexical_cast(string_view key, string const &s) {
  try {
    return boost::lexical_cast<T>(s);
  } catch (boost::bad_lexical_cast &) {
    handle_type_conversion_failure(typeid(T).name(), key, s);
  }
}

} // namespace argmatch::detail

/**
 * \brief Stores the command-line parsing result of one level
 *
 * This maps each argument key that was given (or has a default value) to its values and occurrence count.  If a subcommand was matched, its own Binding is nested here.
 **/
class Binding {
public:
  using Entries = std::map<string, ArgMatch>;

  /**
   * \brief Indicates if \p key occurred on the command line or received a default value
   **/
  bool is_present(string const &key) const;

  /**
   * \returns The number of times \p key occurred on the command line; 0 if only its default applies
   **/
  size_t occurrences_of(string const &key) const;

  /**
   * \returns The first value of \p key
   **/
  optional<string> value_of(string const &key) const;

  /**
   * \returns All values of \p key, in command-line order
   **/
  vector<string> values_of(string const &key) const;

  optional<ValueSource> value_source(string const &key) const;

  /**
   * \brief Retrieves the first value of \p key converted to \p T using Boost.LexicalCast
   * \throws std::invalid_argument if the conversion fails
   **/
  template <class T>
  optional<T> get(string const &key) const {
    auto v = value_of(key);
    if (!v)
      return nullopt;
    return detail::lexical_cast<T>(key, *v);
  }

  /**
   * \brief Retrieves all values of \p key converted to \p T
   * \throws std::invalid_argument if a conversion fails
   **/
  template <class T>
  vector<T> get_all(string const &key) const {
    vector<T> result;
    for (auto const &v : values_of(key))
      result.push_back(detail::lexical_cast<T>(key, v));
    return result;
  }

  optional<string> const &subcommand_name() const { return subcommand_name_; }

  /**
   * \returns The Binding of the matched subcommand, or nullptr
   **/
  Binding const *subcommand() const { return subcommand_.get(); }

  Entries const &entries() const { return entries_; }

  /**
   * \brief Returns the entry for \p key, creating an empty one if needed
   **/
  ArgMatch &entry(string const &key) { return entries_[key]; }

  void set_subcommand(string name, Binding binding);

  bool operator==(Binding const &other) const;
  bool operator!=(Binding const &other) const { return !(*this == other); }

private:
  Entries entries_;
  optional<string> subcommand_name_;
  shared_ptr<Binding const> subcommand_;
};

std::ostream &operator<<(std::ostream &os, Binding const &binding);

} // namespace argmatch

#endif /* HEADER GUARD */
