#include "argmatch/argmatch.hpp"
#include <iostream>

using namespace argmatch;

namespace {

SpecModel make_spec() {
  return build_spec(
      Declarations("using_matches")
          .description("Demonstrates querying the results of a parse.")
          .arg(ArgumentDecl::flag("debug").short_name('d').long_name("debug").multiple()
                   .help("turn on debugging information; repeat for more detail"))
          .arg(ArgumentDecl::option("config").short_name('c').long_name("config").value_name("FILE")
                   .help("sets a custom config file"))
          .arg(ArgumentDecl::positional("input").value_name("INPUT").required().help("the input file to use"))
          .subcommand(Declarations("test")
                          .alias("t")
                          .description("controls testing features")
                          .arg(ArgumentDecl::flag("list").short_name('l').long_name("list")
                                   .help("lists test values"))));
}

} // namespace

int main(int argc, char **argv) {
  auto spec = make_spec();
  auto outcome = parse(spec, argc, argv);

  switch (outcome.kind()) {
  case ParseOutcome::Kind::help_requested:
    std::cout << outcome.help_text();
    return 0;
  case ParseOutcome::Kind::failed:
    std::cerr << error_string(*outcome.error());
    return 1;
  case ParseOutcome::Kind::matched:
    break;
  }

  auto const &m = outcome.binding();

  if (auto input = m.value_of("input"))
    std::cout << "Using input file: " << *input << '\n';

  if (auto config = m.value_of("config"))
    std::cout << "Value for config: " << *config << '\n';

  switch (m.occurrences_of("debug")) {
  case 0: std::cout << "Debug mode is off\n"; break;
  case 1: std::cout << "Debug mode is kind of on\n"; break;
  case 2: std::cout << "Debug mode is on\n"; break;
  default: std::cout << "Don't be crazy\n"; break;
  }

  if (auto test = m.subcommand()) {
    if (test->is_present("list"))
      std::cout << "Printing testing lists...\n";
    else
      std::cout << "Not printing testing lists...\n";
  }

  return 0;
}
