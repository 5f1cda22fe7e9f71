#include "./binding.hpp"
#include <boost/core/demangle.hpp>
#include <ostream>
#include <stdexcept>

namespace argmatch {

namespace detail {

[[noreturn]] void handle_type_conversion_failure(const char *name, string_view key, string_view s) {
  throw std::invalid_argument(string(key) + ": invalid " + boost::core::demangle(name) + " value: " + repr(s));
}

} // namespace argmatch::detail

bool Binding::is_present(string const &key) const {
  return entries_.count(key) != 0;
}

size_t Binding::occurrences_of(string const &key) const {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return 0;
  return it->second.occurrences;
}

optional<string> Binding::value_of(string const &key) const {
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.values.empty())
    return nullopt;
  return it->second.values.front();
}

vector<string> Binding::values_of(string const &key) const {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return {};
  return it->second.values;
}

optional<ValueSource> Binding::value_source(string const &key) const {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return nullopt;
  return it->second.source;
}

void Binding::set_subcommand(string name, Binding binding) {
  subcommand_name_ = std::move(name);
  subcommand_ = std::make_shared<Binding>(std::move(binding));
}

bool Binding::operator==(Binding const &other) const {
  if (entries_ != other.entries_ || subcommand_name_ != other.subcommand_name_)
    return false;
  if (!subcommand_ || !other.subcommand_)
    return !subcommand_ && !other.subcommand_;
  return *subcommand_ == *other.subcommand_;
}

std::ostream &operator<<(std::ostream &os, Binding const &binding) {
  os << '{';
  bool is_first = true;
  for (auto const &p : binding.entries()) {
    if (!is_first)
      os << ", ";
    is_first = false;
    os << p.first << ": [";
    util::join(os, ", ", p.second.values, [](string const &v) { return repr(v); });
    os << "] x" << p.second.occurrences;
    if (p.second.source == ValueSource::default_value)
      os << " (default)";
  }
  if (auto const &name = binding.subcommand_name()) {
    if (!is_first)
      os << ", ";
    os << "subcommand " << *name << ": " << *binding.subcommand();
  }
  return os << '}';
}

} // namespace argmatch
