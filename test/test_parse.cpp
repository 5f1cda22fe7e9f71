#include "test_util.hpp"

namespace argmatch {

namespace {

using testing_util::Expect;
using testing_util::ParserTestCase;
using testing_util::get_string_view_vec;

struct ExampleScenarioTest : public ParserTestCase {
  ExampleScenarioTest() {
    declare(Declarations("prog")
                .arg(ArgumentDecl::option("name").long_name("name").required())
                .arg(ArgumentDecl::flag("verbose").short_name('v').long_name("verbose"))
                .arg(ArgumentDecl::positional("file").multiple()));
  }
};

TEST_F(ExampleScenarioTest, Success) {
  success({"--name=a", "-v", "f1", "f2"},
          Expect().value("name", "a").flag("verbose").values("file", {"f1", "f2"}, 2));
  success({"f1", "--name", "a", "f2", "--verbose"},
          Expect().value("name", "a").flag("verbose").values("file", {"f1", "f2"}, 2));
  success({"--name", "a"}, Expect().value("name", "a"));
}

TEST_F(ExampleScenarioTest, MissingRequired) {
  auto e = parse_error({"-v", "f1"});
  EXPECT_EQ(ErrorKind::missing_required, e.kind());
  EXPECT_EQ("name", e.argument());
  EXPECT_EQ("--name", e.display_name());
  EXPECT_EQ("the following arguments are required: --name", string(e.what()));
}

TEST_F(ExampleScenarioTest, Idempotent) {
  std::vector<std::string> args{"--name=a", "-v", "f1", "f2"};
  EXPECT_EQ(parse_ok(args), parse_ok(args));

  std::vector<std::string> bad{"--nme=a"};
  EXPECT_EQ(parse_error(bad), parse_error(bad));
}

TEST_F(ExampleScenarioTest, Failures) {
  failures({{"--name"}, {"--name", "--verbose"}}, ErrorKind::missing_value);
  failures({{"--name", "a", "--name", "b"}, {"--name=a", "-vv"}}, ErrorKind::too_many_occurrences);
  failures({{"--name=a", "--bogus"}, {"--name=a", "-x"}, {"--name=a", "-vx"}}, ErrorKind::unknown_argument);
  failures({{"--=a"}, {"-=a"}}, ErrorKind::malformed_token);
  failures({{"--name=a", "--verbose=1"}}, ErrorKind::unexpected_value);
}

TEST_F(ExampleScenarioTest, BindErrorsPrecedeValidation) {
  // --name is missing as well, but the unknown argument is reported first
  auto e = parse_error({"--verbos"});
  EXPECT_EQ(ErrorKind::unknown_argument, e.kind());
  EXPECT_EQ("--verbose", *e.suggestion());
}

struct ClusterTest : public ParserTestCase {
  ClusterTest() {
    declare(Declarations("prog")
                .arg(ArgumentDecl::flag("a").short_name('a'))
                .arg(ArgumentDecl::flag("b").short_name('b'))
                .arg(ArgumentDecl::flag("c").short_name('c'))
                .arg(ArgumentDecl::option("n").short_name('n')));
  }
};

TEST_F(ClusterTest, Clustered) {
  auto expected = Expect().flag("a").flag("b").flag("c");
  success({"-abc"}, expected);
  success({"-a", "-b", "-c"}, expected);
  success({"-ca", "-b"}, expected);
}

TEST_F(ClusterTest, ValueInCluster) {
  success({"-n5"}, Expect().value("n", "5"));
  success({"-n", "5"}, Expect().value("n", "5"));
  success({"-n=5"}, Expect().value("n", "5"));
  success({"-abn5"}, Expect().flag("a").flag("b").value("n", "5"));
  failures({{"-an", "-c"}, {"-n"}}, ErrorKind::missing_value);
}

TEST_F(ClusterTest, EmptyJoinedValue) {
  success({"-n="}, Expect().value("n", ""));
}

struct PossibleValuesTest : public ParserTestCase {
  PossibleValuesTest() {
    declare(Declarations("prog")
                .arg(ArgumentDecl::option("mode").long_name("mode").possible_values({"fast", "slow"}))
                .arg(ArgumentDecl::positional("color").possible_values({"red", "blue"})));
  }
};

TEST_F(PossibleValuesTest, Accepted) {
  success({"--mode", "fast", "red"}, Expect().value("mode", "fast").value("color", "red"));
  success({"--mode=slow", "blue"}, Expect().value("mode", "slow").value("color", "blue"));
}

TEST_F(PossibleValuesTest, Rejected) {
  failures({{"--mode", "medium"}, {"--mode="}, {"green"}, {"--mode", "fast", "RED"}}, ErrorKind::invalid_value);
}

struct ConflictTest : public ParserTestCase {
  ConflictTest() {
    declare(Declarations("prog")
                .arg(ArgumentDecl::flag("x").short_name('x'))
                .arg(ArgumentDecl::flag("y").short_name('y'))
                .group(GroupDecl::conflict("xy", {"x", "y"})));
  }
};

TEST_F(ConflictTest, Symmetric) {
  success({"-x"}, Expect().flag("x"));
  success({"-y"}, Expect().flag("y"));
  auto e1 = parse_error({"-x", "-y"});
  auto e2 = parse_error({"-y", "-x"});
  auto e3 = parse_error({"-yx"});
  EXPECT_EQ(ErrorKind::conflicting_arguments, e1.kind());
  EXPECT_EQ(e1, e2);
  EXPECT_EQ(e1, e3);
}

struct EndOfOptionsTest : public ParserTestCase {
  EndOfOptionsTest() {
    declare(Declarations("prog").arg(ArgumentDecl::positional("args").multiple()));
  }
};

TEST_F(EndOfOptionsTest, LiteralValues) {
  success({"--", "-not-a-flag"}, Expect().value("args", "-not-a-flag"));
  success({"a", "--", "--", "-h"}, Expect().values("args", {"a", "--", "-h"}, 3));
  success({"-"}, Expect().value("args", "-"));
  failures({{"-not-a-flag"}}, ErrorKind::unknown_argument);
}

struct SubcommandTest : public ParserTestCase {
  SubcommandTest() {
    declare(Declarations("prog")
                .arg(ArgumentDecl::flag("verbose").short_name('v'))
                .subcommand(Declarations("build")
                                .alias("b")
                                .arg(ArgumentDecl::option("target").long_name("target").required())
                                .arg(ArgumentDecl::flag("verbose").short_name('v')))
                .subcommand(Declarations("clean")));
  }
};

TEST_F(SubcommandTest, Nested) {
  success({"build", "--target=x"}, Expect().subcommand("build", Expect().value("target", "x")));
  success({"-v", "b", "--target", "x", "-v"},
          Expect().flag("verbose").subcommand("build", Expect().value("target", "x").flag("verbose")));
  success({"clean"}, Expect().subcommand("clean", Expect()));
  success({}, Expect());
}

TEST_F(SubcommandTest, NestedMissingRequired) {
  auto e = parse_error({"build"});
  EXPECT_EQ(ErrorKind::missing_required, e.kind());
  EXPECT_EQ("target", e.argument());
  EXPECT_EQ("build", e.spec().name());
  EXPECT_EQ("prog build", e.spec().prog());
}

TEST_F(SubcommandTest, ArgumentsBelongToTheirLevel) {
  auto e = parse_error({"build", "--target=x", "clean"});
  EXPECT_EQ(ErrorKind::unknown_argument, e.kind());
  EXPECT_EQ("build", e.spec().name());

  e = parse_error({"--target=x", "build"});
  EXPECT_EQ(ErrorKind::unknown_argument, e.kind());
  EXPECT_EQ("prog", e.spec().name());
}

TEST_F(SubcommandTest, UnknownSubcommand) {
  auto e = parse_error({"biuld"});
  EXPECT_EQ(ErrorKind::unknown_argument, e.kind());
  ASSERT_TRUE(e.suggestion());
  EXPECT_EQ("build", *e.suggestion());
}

TEST_F(SubcommandTest, Help) {
  std::vector<std::string> args{"build", "--help"};
  auto outcome = parse(spec, get_string_view_vec(args), 80);
  ASSERT_EQ(ParseOutcome::Kind::help_requested, outcome.kind());
  EXPECT_FALSE(outcome);
  EXPECT_EQ("prog build", outcome.help_spec().prog());
  EXPECT_EQ(spec.find_subcommand("build")->help_string(80), outcome.help_text());

  args = {"help", "b"};
  outcome = parse(spec, get_string_view_vec(args), 80);
  ASSERT_EQ(ParseOutcome::Kind::help_requested, outcome.kind());
  EXPECT_EQ("build", outcome.help_spec().name());

  args = {"help"};
  outcome = parse(spec, get_string_view_vec(args), 80);
  ASSERT_EQ(ParseOutcome::Kind::help_requested, outcome.kind());
  EXPECT_EQ(spec.help_string(80), outcome.help_text());

  // Help is recognized before the missing --target is detected
  args = {"build", "-h"};
  EXPECT_THROW(try_parse(spec, get_string_view_vec(args)), HelpRequested);

  // ... but not after the end of options
  args = {"--", "help"};
  EXPECT_EQ(ErrorKind::unknown_argument, parse_error(args).kind());
}

TEST(SubcommandRequiredTest, Basic) {
  Settings settings;
  settings.subcommand_required = true;
  auto spec = build_spec(Declarations("prog").settings(settings).subcommand(Declarations("run")));

  std::vector<std::string> args;
  auto outcome = parse(spec, get_string_view_vec(args));
  ASSERT_EQ(ParseOutcome::Kind::failed, outcome.kind());
  EXPECT_EQ("the following arguments are required: <SUBCOMMAND>", string(outcome.error()->what()));

  args = {"run"};
  outcome = parse(spec, get_string_view_vec(args));
  ASSERT_TRUE(outcome);
  EXPECT_EQ("run", *outcome.binding().subcommand_name());
}

TEST(DefaultsTest, AppliedPerLevel) {
  auto spec = build_spec(Declarations("prog")
                             .arg(ArgumentDecl::option("color").long_name("color").default_value("auto"))
                             .subcommand(Declarations("log").arg(ArgumentDecl::option("count").short_name('n').default_value("10"))));
  std::vector<std::string> args{"log"};
  auto b = try_parse(spec, get_string_view_vec(args));
  EXPECT_EQ("auto", *b.value_of("color"));
  EXPECT_EQ(0u, b.occurrences_of("color"));
  ASSERT_TRUE(b.subcommand());
  EXPECT_EQ(10, *b.subcommand()->get<int>("count"));
  EXPECT_EQ(ValueSource::default_value, *b.subcommand()->value_source("count"));

  args = {"--color", "never", "log", "-n3"};
  b = try_parse(spec, get_string_view_vec(args));
  EXPECT_EQ("never", *b.value_of("color"));
  EXPECT_EQ(1u, b.occurrences_of("color"));
  EXPECT_EQ(3, *b.subcommand()->get<int>("count"));
  EXPECT_FALSE(b.get<int>("missing"));
}

TEST(TypedValueTest, ConversionFailure) {
  auto spec = build_spec(Declarations("prog").arg(ArgumentDecl::option("count").short_name('n')));
  std::vector<std::string> args{"-n", "ten"};
  auto b = try_parse(spec, get_string_view_vec(args));
  EXPECT_EQ("ten", *b.get<string>("count"));
  try {
    b.get<int>("count");
    FAIL() << "expected std::invalid_argument";
  } catch (std::invalid_argument const &e) {
    EXPECT_EQ("count: invalid int value: 'ten'", string(e.what()));
  }
}

TEST(TypedValueTest, AllValues) {
  auto spec = build_spec(Declarations("prog").arg(ArgumentDecl::positional("n").multiple()));
  std::vector<std::string> args{"1", "2", "3"};
  auto b = try_parse(spec, get_string_view_vec(args));
  EXPECT_EQ((vector<int>{1, 2, 3}), b.get_all<int>("n"));
  EXPECT_TRUE(b.get_all<int>("missing").empty());
}

TEST(ArgvTest, SkipsProgramName) {
  auto spec = build_spec(Declarations().arg(ArgumentDecl::positional("x")));
  char prog[] = "/usr/bin/tool", x[] = "value", help[] = "-h";
  char *argv[] = {prog, x};
  auto b = try_parse(spec, 2, argv);
  EXPECT_EQ("value", *b.value_of("x"));

  char *help_argv[] = {prog, help};
  auto outcome = parse(spec, 2, help_argv, 80);
  ASSERT_EQ(ParseOutcome::Kind::help_requested, outcome.kind());
  EXPECT_EQ("usage: /usr/bin/tool [-h] [X]\n", outcome.help_text().substr(0, outcome.help_text().find('\n') + 1));
}

} // namespace

} // namespace argmatch
