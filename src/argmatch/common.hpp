#ifndef HEADER_GUARD_ee67dd12f1caf0924e256d3eea818f37
#define HEADER_GUARD_ee67dd12f1caf0924e256d3eea818f37

#include <string>
#include <experimental/string_view>
#include <experimental/optional>
#include <memory>
#include <vector>
#include <sstream>

namespace argmatch {

using std::experimental::optional;
using std::experimental::nullopt;
using std::string;
using std::experimental::string_view;
using std::vector;
using std::shared_ptr;
using std::weak_ptr;

/**
 * Returns a representation of a string in string literal syntax
 **/
string repr(string_view s);

/**
 * \brief Specifies a list of strings.
 *
 * This can be implicitly constructed from either a single string or a list of strings.
 **/
class StringList : public vector<string> {
public:
  StringList() = default;
  StringList(const char *x) : vector<string>{ std::string(x) } {}
  StringList(std::string x) : vector<string>{ std::move(x) } {}
  StringList(string_view x) : vector<string>{ std::string(x) } {}
  StringList(std::initializer_list<std::string> x) : vector<string>(x) {}
  StringList(std::vector<std::string> x) : vector<string>(std::move(x)) {}
};

/**
 * Generic utilities
 **/
namespace util {

template <class Assoc, class Key>
auto find_ptr(Assoc const &assoc, Key const &key) {
  auto it = assoc.find(key);
  if (it != assoc.end())
    return &it->second;
  return decltype(&it->second)(nullptr);
}

struct always_true_pred {
  template <class... T>
  bool operator()(T &&...) {
    return true;
  }
};

struct identity {
  template <class T>
  T &&operator()(T &&x) { return std::forward<T>(x); }
};

template <class Range, class Transform = identity, class Predicate = always_true_pred>
void join(std::ostream &os, string_view sep, Range const &args, Transform &&t = {}, Predicate &&p = {}) {
  bool first = true;
  for (auto const &x : args) {
    if (!p(x))
      continue;
    if (!first)
      os << sep;
    first = false;
    os << t(x);
  }
}

template <class Range, class Transform = identity, class Predicate = always_true_pred>
string join(string_view sep, Range const &args, Transform &&t = {}, Predicate &&p = {}) {
  std::ostringstream ostr;
  join(ostr, sep, args, std::forward<Transform>(t), std::forward<Predicate>(p));
  return ostr.str();
}

bool starts_with(string_view s, string_view prefix);

// This converts an ASCII string to uppercase.  This is broken for UTF-8 since in unicode and especially UTF-8 upper case is not a code-point-wise operation.
string ascii_to_upper(string_view s);

string replace_all(string_view s, string_view find_str, string_view replace_str);

/**
 * \brief Levenshtein distance between two strings, counted in bytes
 **/
size_t edit_distance(string_view a, string_view b);

} // namespace argmatch::util

} // namespace argmatch

#endif /* HEADER GUARD */
