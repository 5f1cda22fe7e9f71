#include "./spec.hpp"
#include <algorithm>
#include <unordered_set>

namespace argmatch {

using util::join;
using util::find_ptr;

Nargs::Nargs(NargsValue value) {
  switch (value) {
  case OPTIONAL:
    min = 0; max = 1;
    return;
  case ZERO_OR_MORE:
    min = 0; max = UNBOUNDED;
    return;
  case ONE_OR_MORE:
    min = 1; max = UNBOUNDED;
    return;
  }
  if (value >= 0) {
    min = max = static_cast<size_t>(value);
    return;
  }
  throw std::invalid_argument("Invalid nargs value encountered");
}

Nargs::Nargs(int count) {
  if (count < 0)
    throw std::invalid_argument("Explicit number of arguments must be positive");
  min = max = static_cast<size_t>(count);
}

Nargs::Nargs(size_t min, size_t max)
  : min(min), max(max) {
  if (min > max)
    throw std::invalid_argument("Minimum number of arguments exceeds maximum");
}

string ArgumentSpec::name() const {
  if (long_name)
    return "--" + *long_name;
  if (short_name)
    return string("-") + *short_name;
  return '<' + format_metavar() + '>';
}

string ArgumentSpec::format_metavar() const {
  if (!value_name.empty())
    return value_name;
  return util::ascii_to_upper(key);
}

bool ArgumentSpec::accepts(string_view value) const {
  if (possible_values.empty())
    return true;
  return std::find(possible_values.begin(), possible_values.end(), value) != possible_values.end();
}

/**
 * ArgumentDecl
 **/

ArgumentDecl::ArgumentDecl(string key, ArgKind kind) {
  spec_.key = std::move(key);
  spec_.kind = kind;
  spec_.nargs = Nargs(kind == ArgKind::flag ? 0 : 1);
}

ArgumentDecl ArgumentDecl::flag(string key) { return ArgumentDecl(std::move(key), ArgKind::flag); }
ArgumentDecl ArgumentDecl::option(string key) { return ArgumentDecl(std::move(key), ArgKind::option); }
ArgumentDecl ArgumentDecl::positional(string key) { return ArgumentDecl(std::move(key), ArgKind::positional); }

ArgumentDecl &ArgumentDecl::short_name(char c) {
  spec_.short_name = c;
  return *this;
}

ArgumentDecl &ArgumentDecl::long_name(string name) {
  spec_.long_name = std::move(name);
  return *this;
}

ArgumentDecl &ArgumentDecl::help(string text) {
  spec_.help = std::move(text);
  return *this;
}

ArgumentDecl &ArgumentDecl::hidden(bool value) {
  spec_.hidden = value;
  return *this;
}

ArgumentDecl &ArgumentDecl::required(bool value) {
  spec_.required = value;
  return *this;
}

ArgumentDecl &ArgumentDecl::multiple(bool value) {
  spec_.multiple = value;
  return *this;
}

ArgumentDecl &ArgumentDecl::nargs(Nargs value) {
  spec_.nargs = value;
  explicit_nargs_ = true;
  return *this;
}

ArgumentDecl &ArgumentDecl::default_value(string value) {
  spec_.default_value = std::move(value);
  return *this;
}

ArgumentDecl &ArgumentDecl::possible_values(StringList values) {
  spec_.possible_values = std::move(values);
  return *this;
}

ArgumentDecl &ArgumentDecl::value_name(string name) {
  spec_.value_name = std::move(name);
  return *this;
}

ArgumentDecl &ArgumentDecl::index(size_t value) {
  spec_.index = value;
  return *this;
}

ArgumentDecl &ArgumentDecl::conflicts_with(string key) {
  conflicts_.push_back(std::move(key));
  return *this;
}

ArgumentDecl &ArgumentDecl::requires_arg(string key) {
  requirements_.push_back(std::move(key));
  return *this;
}

GroupDecl GroupDecl::conflict(string id, StringList members) {
  GroupDecl g;
  g.id = std::move(id);
  g.kind = GroupKind::conflict;
  g.members = std::move(members);
  return g;
}

GroupDecl GroupDecl::requirement(string id, StringList members, StringList targets) {
  GroupDecl g;
  g.id = std::move(id);
  g.kind = GroupKind::requirement;
  g.members = std::move(members);
  g.targets = std::move(targets);
  return g;
}

GroupDecl GroupDecl::one_required(string id, StringList members) {
  GroupDecl g;
  g.id = std::move(id);
  g.kind = GroupKind::one_required;
  g.members = std::move(members);
  return g;
}

/**
 * Declarations
 **/

Declarations::Declarations(string name)
  : name_(std::move(name))
{}

Declarations &Declarations::description(string s) {
  description_ = std::move(s);
  return *this;
}

Declarations &Declarations::epilog(string s) {
  epilog_ = std::move(s);
  return *this;
}

Declarations &Declarations::usage(string s) {
  usage_ = std::move(s);
  return *this;
}

Declarations &Declarations::alias(string name) {
  aliases_.push_back(std::move(name));
  return *this;
}

Declarations &Declarations::settings(Settings value) {
  settings_ = value;
  return *this;
}

Declarations &Declarations::arg(ArgumentDecl decl) {
  arguments_.push_back(std::move(decl));
  return *this;
}

Declarations &Declarations::group(GroupDecl decl) {
  groups_.push_back(std::move(decl));
  return *this;
}

Declarations &Declarations::subcommand(Declarations decl) {
  subcommands_.push_back(std::move(decl));
  return *this;
}

/**
 * SpecModel
 **/

struct SpecModel::Impl {
  string name;
  string description;
  string epilog;
  optional<string> usage;
  vector<string> aliases;
  Settings settings;

  vector<ArgumentSpec> arguments;
  vector<ArgumentSpec const *> positionals;
  vector<Group> groups;
  vector<SpecModel> subcommands;

  std::unordered_map<string, size_t> key_index;
  std::unordered_map<char, size_t> short_index;
  std::unordered_map<string, size_t> long_index;
  std::unordered_map<string, size_t> subcommand_index;

  // Navigation only; never used while matching
  weak_ptr<Impl const> parent;
};

string const &SpecModel::name() const { return impl->name; }

string SpecModel::prog() const {
  if (auto p = impl->parent.lock()) {
    return SpecModel(p).prog() + " " + impl->name;
  }
  return impl->name;
}

string const &SpecModel::description() const { return impl->description; }
string const &SpecModel::epilog() const { return impl->epilog; }
optional<string> const &SpecModel::usage() const { return impl->usage; }
vector<string> const &SpecModel::aliases() const { return impl->aliases; }
Settings const &SpecModel::settings() const { return impl->settings; }
vector<ArgumentSpec> const &SpecModel::arguments() const { return impl->arguments; }
vector<ArgumentSpec const *> const &SpecModel::positionals() const { return impl->positionals; }
vector<Group> const &SpecModel::groups() const { return impl->groups; }
vector<SpecModel> const &SpecModel::subcommands() const { return impl->subcommands; }

ArgumentSpec const *SpecModel::find_key(string_view key) const {
  if (auto i = find_ptr(impl->key_index, string(key)))
    return &impl->arguments[*i];
  return nullptr;
}

ArgumentSpec const *SpecModel::find_short(char c) const {
  if (auto i = find_ptr(impl->short_index, c))
    return &impl->arguments[*i];
  return nullptr;
}

ArgumentSpec const *SpecModel::find_long(string_view name) const {
  if (auto i = find_ptr(impl->long_index, string(name)))
    return &impl->arguments[*i];
  return nullptr;
}

SpecModel const *SpecModel::find_subcommand(string_view name) const {
  if (auto i = find_ptr(impl->subcommand_index, string(name)))
    return &impl->subcommands[*i];
  return nullptr;
}

SpecModel SpecModel::parent() const {
  return SpecModel(impl->parent.lock());
}

bool SpecModel::help_short_enabled() const {
  return !impl->settings.disable_help_flag && !find_short('h');
}

bool SpecModel::help_long_enabled() const {
  return !impl->settings.disable_help_flag && !find_long("help");
}

bool SpecModel::help_subcommand_enabled() const {
  return !impl->settings.disable_help_subcommand && !impl->subcommands.empty() && !find_subcommand("help");
}

/**
 * build_spec
 **/

namespace {

[[noreturn]] void config_error(ConfigErrorKind kind, string const &level, string const &message) {
  if (level.empty())
    throw ConfigError(kind, message);
  throw ConfigError(kind, level + ": " + message);
}

void check_identity(ArgumentSpec const &spec, string const &level) {
  if (spec.key.empty())
    config_error(ConfigErrorKind::invalid_declaration, level, "argument key must be non-empty");

  if (spec.long_name) {
    auto const &l = *spec.long_name;
    if (l.empty() || l[0] == '-' || l.find('=') != string::npos)
      config_error(ConfigErrorKind::invalid_declaration, level, "invalid long name " + repr(l) + " for argument " + repr(spec.key));
  }
  if (spec.short_name) {
    char c = *spec.short_name;
    if (c == '-' || c == '=' || c == ' ' || c == '\0')
      config_error(ConfigErrorKind::invalid_declaration, level, "invalid short name for argument " + repr(spec.key));
  }

  switch (spec.kind) {
  case ArgKind::positional:
    if (spec.short_name || spec.long_name)
      config_error(ConfigErrorKind::invalid_declaration, level, "positional argument " + repr(spec.key) + " cannot have a short or long name");
    if (spec.nargs.max == 0)
      config_error(ConfigErrorKind::invalid_declaration, level, "nargs cannot be 0 for positional argument " + repr(spec.key));
    break;
  case ArgKind::option:
    if (spec.nargs.max == 0)
      config_error(ConfigErrorKind::invalid_declaration, level, "nargs cannot be 0 for option " + repr(spec.key));
    // fall through
  case ArgKind::flag:
    if (!spec.short_name && !spec.long_name)
      config_error(ConfigErrorKind::invalid_declaration, level, "argument " + repr(spec.key) + " needs a short name, a long name, or both");
    break;
  }

  if (spec.kind == ArgKind::flag) {
    if (spec.nargs.max != 0)
      config_error(ConfigErrorKind::invalid_declaration, level, "flag " + repr(spec.key) + " cannot take values");
    if (!spec.possible_values.empty())
      config_error(ConfigErrorKind::invalid_declaration, level, "flag " + repr(spec.key) + " cannot have possible values");
  }

  if (spec.default_value && !spec.accepts(*spec.default_value))
    config_error(ConfigErrorKind::invalid_declaration, level,
                 "default value " + repr(*spec.default_value) + " of argument " + repr(spec.key) + " is not a possible value");
}

/**
 * Assigns indices to positionals lacking an explicit one, and checks the ordering rules.
 **/
void assign_positional_indices(SpecModel::Impl &impl, string const &level) {
  vector<ArgumentSpec *> positionals;
  std::unordered_set<size_t> used;
  for (auto &a : impl.arguments) {
    if (!a.is_positional())
      continue;
    positionals.push_back(&a);
    if (a.index != 0 && !used.insert(a.index).second)
      config_error(ConfigErrorKind::invalid_positional_ordering, level,
                   "duplicate positional index " + std::to_string(a.index) + " for argument " + repr(a.key));
  }

  size_t next = 1;
  for (auto a : positionals) {
    if (a->index != 0)
      continue;
    while (used.count(next))
      ++next;
    a->index = next;
    used.insert(next);
  }

  std::sort(positionals.begin(), positionals.end(),
            [](ArgumentSpec const *a, ArgumentSpec const *b) { return a->index < b->index; });

  for (size_t i = 0; i < positionals.size(); ++i) {
    auto const &a = *positionals[i];
    if (a.index != i + 1)
      config_error(ConfigErrorKind::invalid_positional_ordering, level,
                   "positional indices must be contiguous starting at 1, but " + repr(a.key) + " has index " + std::to_string(a.index));
    if (a.nargs.is_unbounded() && i + 1 != positionals.size())
      config_error(ConfigErrorKind::invalid_positional_ordering, level,
                   "only the last positional argument may take an unbounded number of values, but " + repr(a.key) + " does");
    if (i > 0 && a.required && !positionals[i - 1]->required)
      config_error(ConfigErrorKind::invalid_positional_ordering, level,
                   "required positional argument " + repr(a.key) + " follows optional positional argument " + repr(positionals[i - 1]->key));
  }

  impl.positionals.assign(positionals.begin(), positionals.end());
}

size_t resolve_member(SpecModel::Impl const &impl, string const &group_id, string const &key, string const &level) {
  if (auto i = find_ptr(impl.key_index, key))
    return *i;
  config_error(ConfigErrorKind::unknown_group_member, level,
               "group " + repr(group_id) + " references unknown argument " + repr(key));
}

void add_group(SpecModel::Impl &impl, GroupDecl const &decl, std::unordered_set<string> &group_ids, string const &level) {
  if (decl.id.empty())
    config_error(ConfigErrorKind::invalid_declaration, level, "group id must be non-empty");
  if (!group_ids.insert(decl.id).second)
    config_error(ConfigErrorKind::invalid_declaration, level, "duplicate group id " + repr(decl.id));
  if (decl.members.empty())
    config_error(ConfigErrorKind::invalid_declaration, level, "group " + repr(decl.id) + " has no members");
  if (decl.kind == GroupKind::requirement && decl.targets.empty())
    config_error(ConfigErrorKind::invalid_declaration, level, "requirement group " + repr(decl.id) + " has no targets");
  if (decl.kind != GroupKind::requirement && !decl.targets.empty())
    config_error(ConfigErrorKind::invalid_declaration, level, "only requirement groups may have targets, but " + repr(decl.id) + " does");

  Group g;
  g.id = decl.id;
  g.kind = decl.kind;
  for (auto const &m : decl.members)
    g.members.push_back(resolve_member(impl, decl.id, m, level));
  for (auto const &t : decl.targets)
    g.targets.push_back(resolve_member(impl, decl.id, t, level));

  // Members are kept in declaration order so that diagnostics do not depend on how the group was written
  std::sort(g.members.begin(), g.members.end());
  g.members.erase(std::unique(g.members.begin(), g.members.end()), g.members.end());
  std::sort(g.targets.begin(), g.targets.end());
  g.targets.erase(std::unique(g.targets.begin(), g.targets.end()), g.targets.end());

  for (auto i : g.members)
    impl.arguments[i].groups.push_back(g.id);
  for (auto i : g.targets) {
    auto &groups = impl.arguments[i].groups;
    if (std::find(groups.begin(), groups.end(), g.id) == groups.end())
      groups.push_back(g.id);
  }

  impl.groups.push_back(std::move(g));
}

shared_ptr<SpecModel::Impl> build_level(Declarations const &decl, shared_ptr<SpecModel::Impl const> const &parent) {
  shared_ptr<SpecModel::Impl> impl(new SpecModel::Impl);
  impl->name = decl.name();
  impl->description = decl.description();
  impl->epilog = decl.epilog();
  impl->usage = decl.usage();
  impl->aliases = decl.aliases();
  impl->settings = decl.settings();
  impl->parent = parent;

  string level = parent ? SpecModel(parent).prog() + " " + decl.name() : decl.name();

  for (auto const &arg_decl : decl.arguments()) {
    ArgumentSpec spec = arg_decl.spec();
    if (spec.is_positional() && spec.multiple && !arg_decl.has_explicit_nargs())
      spec.nargs = ONE_OR_MORE;
    if (spec.kind != ArgKind::positional && spec.index != 0)
      config_error(ConfigErrorKind::invalid_declaration, level, "only positional arguments may have an index, but " + repr(spec.key) + " does");
    check_identity(spec, level);

    size_t i = impl->arguments.size();
    if (!impl->key_index.emplace(spec.key, i).second)
      config_error(ConfigErrorKind::duplicate_identity, level, "duplicate argument key " + repr(spec.key));
    if (spec.short_name && !impl->short_index.emplace(*spec.short_name, i).second)
      config_error(ConfigErrorKind::duplicate_identity, level, "conflicting option string: -" + string(1, *spec.short_name));
    if (spec.long_name && !impl->long_index.emplace(*spec.long_name, i).second)
      config_error(ConfigErrorKind::duplicate_identity, level, "conflicting option string: --" + *spec.long_name);
    impl->arguments.push_back(std::move(spec));
  }

  assign_positional_indices(*impl, level);

  std::unordered_set<string> group_ids;
  for (auto const &g : decl.groups())
    add_group(*impl, g, group_ids, level);

  // Shorthand relationships declared on the arguments themselves
  for (auto const &arg_decl : decl.arguments()) {
    auto const &key = arg_decl.spec().key;
    for (auto const &other : arg_decl.conflicts())
      add_group(*impl, GroupDecl::conflict(key + ":conflicts_with:" + other, {key, other}), group_ids, level);
    for (auto const &other : arg_decl.requirements())
      add_group(*impl, GroupDecl::requirement(key + ":requires:" + other, key, other), group_ids, level);
  }

  for (auto const &sub : decl.subcommands()) {
    if (sub.name().empty())
      config_error(ConfigErrorKind::invalid_declaration, level, "subcommand name must be non-empty");
    size_t i = impl->subcommands.size();
    if (!impl->subcommand_index.emplace(sub.name(), i).second)
      config_error(ConfigErrorKind::invalid_declaration, level, "duplicate subcommand name " + repr(sub.name()));
    for (auto const &alias : sub.aliases()) {
      if (!impl->subcommand_index.emplace(alias, i).second)
        config_error(ConfigErrorKind::invalid_declaration, level, "duplicate subcommand name " + repr(alias));
    }
    impl->subcommands.push_back(SpecModel(build_level(sub, impl)));
  }

  return impl;
}

} // namespace

SpecModel build_spec(Declarations const &declarations) {
  if (!declarations.aliases().empty())
    throw ConfigError(ConfigErrorKind::invalid_declaration, "aliases are only valid for subcommands");
  return SpecModel(build_level(declarations, {}));
}

} // namespace argmatch
