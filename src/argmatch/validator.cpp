#include "./validator.hpp"
#include "./error.hpp"

namespace argmatch {

namespace {

bool occurred(Binding const &binding, ArgumentSpec const &arg) {
  return binding.occurrences_of(arg.key) > 0;
}

void check_required(SpecModel const &spec, Binding const &binding) {
  vector<ArgumentSpec const *> missing;
  for (auto const &a : spec.arguments()) {
    if (a.required && !binding.is_present(a.key))
      missing.push_back(&a);
  }
  if (!missing.empty())
    report::missing_required(spec, missing);

  if (spec.settings().subcommand_required && !spec.subcommands().empty() && !binding.subcommand_name())
    report::missing_subcommand(spec);
}

void check_group(SpecModel const &spec, Binding const &binding, Group const &group) {
  auto const &args = spec.arguments();
  switch (group.kind) {
  case GroupKind::conflict: {
    ArgumentSpec const *first = nullptr;
    for (auto i : group.members) {
      if (!occurred(binding, args[i]))
        continue;
      if (first)
        report::conflicting_arguments(spec, group, *first, args[i]);
      first = &args[i];
    }
    break;
  }
  case GroupKind::requirement:
    for (auto i : group.members) {
      if (!occurred(binding, args[i]))
        continue;
      for (auto j : group.targets) {
        if (!occurred(binding, args[j]))
          report::requirement_unmet(spec, group, args[i], args[j]);
      }
    }
    break;
  case GroupKind::one_required:
    for (auto i : group.members) {
      if (occurred(binding, args[i]))
        return;
    }
    report::one_required_unmet(spec, group);
  }
}

} // namespace

void validate_level(SpecModel const &spec, Binding const &binding) {
  check_required(spec, binding);
  for (auto kind : { GroupKind::conflict, GroupKind::requirement, GroupKind::one_required }) {
    for (auto const &g : spec.groups()) {
      if (g.kind == kind)
        check_group(spec, binding, g);
    }
  }
}

void validate(SpecModel const &spec, Binding const &binding) {
  SpecModel level = spec;
  Binding const *b = &binding;
  while (true) {
    validate_level(level, *b);
    auto const &name = b->subcommand_name();
    if (!name)
      return;
    auto sub = level.find_subcommand(*name);
    if (!sub || !b->subcommand())
      throw std::logic_error("Binding names subcommand " + repr(*name) + " unknown to " + level.prog());
    level = *sub;
    b = b->subcommand();
  }
}

} // namespace argmatch
