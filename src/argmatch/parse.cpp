#include "./parse.hpp"
#include "./matcher.hpp"
#include "./validator.hpp"

namespace argmatch {

Binding try_parse(SpecModel const &spec, vector<string_view> const &args, HelpFormatterParameters const &params) {
  vector<SpecModel> levels;
  vector<Binding> bindings;

  SpecModel level = spec;
  size_t start = 0;
  while (true) {
    auto m = match_level(level, args, start, params);
    levels.push_back(level);
    bindings.push_back(std::move(m.binding));
    if (!m.subcommand)
      break;
    level = *m.subcommand;
    start = m.subcommand_start;
  }

  // Nest each subcommand binding in that of its parent, under the canonical name
  Binding result = std::move(bindings.back());
  for (size_t i = levels.size() - 1; i > 0; --i) {
    Binding parent = std::move(bindings[i - 1]);
    parent.set_subcommand(levels[i].name(), std::move(result));
    result = std::move(parent);
  }

  validate(spec, result);
  return result;
}

Binding try_parse(SpecModel const &spec, int argc, char **argv, HelpFormatterParameters params) {
  if (argc > 0 && params.prog.empty() && spec.name().empty())
    params.prog = argv[0];

  vector<string_view> args;
  for (int i = 1; i < argc; ++i)
    args.push_back(argv[i]);
  return try_parse(spec, args, params);
}

ParseOutcome parse(SpecModel const &spec, vector<string_view> const &args, HelpFormatterParameters const &params) {
  try {
    return ParseOutcome(try_parse(spec, args, params));
  } catch (HelpRequested const &help) {
    return ParseOutcome(help);
  } catch (ParseError const &e) {
    return ParseOutcome(e);
  }
}

ParseOutcome parse(SpecModel const &spec, int argc, char **argv, HelpFormatterParameters const &params) {
  try {
    return ParseOutcome(try_parse(spec, argc, argv, params));
  } catch (HelpRequested const &help) {
    return ParseOutcome(help);
  } catch (ParseError const &e) {
    return ParseOutcome(e);
  }
}

} // namespace argmatch
