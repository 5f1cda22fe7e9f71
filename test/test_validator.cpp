#include "test_util.hpp"
#include "argmatch/validator.hpp"

namespace argmatch {

namespace {

using testing_util::Expect;

ParseError validation_error(SpecModel const &spec, Binding const &binding) {
  try {
    validate(spec, binding);
  } catch (ParseError const &e) {
    return e;
  }
  ADD_FAILURE() << "expected a validation error for " << binding;
  return ParseError(spec, {}, "no error");
}

class ValidatorTest : public ::testing::Test {
protected:
  SpecModel spec = build_spec(
      Declarations("prog")
          .arg(ArgumentDecl::option("name").long_name("name").required())
          .arg(ArgumentDecl::option("level").long_name("level").required().default_value("1"))
          .arg(ArgumentDecl::flag("x").short_name('x'))
          .arg(ArgumentDecl::flag("y").short_name('y'))
          .arg(ArgumentDecl::flag("z").short_name('z'))
          .arg(ArgumentDecl::option("user").long_name("user").default_value("root"))
          .arg(ArgumentDecl::option("password").long_name("password"))
          .group(GroupDecl::conflict("xyz", {"z", "y", "x"}))
          .group(GroupDecl::requirement("auth", "password", "user")));
};

TEST_F(ValidatorTest, Valid) {
  EXPECT_NO_THROW(validate(spec, Expect().value("name", "n").default_value("level", "1").binding()));
  EXPECT_NO_THROW(validate(spec, Expect().value("name", "n").value("level", "2").flag("y").binding()));
  EXPECT_NO_THROW(validate(spec, Expect().value("name", "n").value("level", "2").value("password", "p").value("user", "u").binding()));
}

TEST_F(ValidatorTest, MissingRequired) {
  auto e = validation_error(spec, Expect().flag("x").flag("y").binding());
  EXPECT_EQ(ErrorKind::missing_required, e.kind());
  EXPECT_EQ(ErrorCategory::validation, e.category());
  EXPECT_EQ("name", e.argument());
  EXPECT_EQ("the following arguments are required: --name, --level", string(e.what()));
}

TEST_F(ValidatorTest, DefaultSatisfiesRequired) {
  auto e = validation_error(spec, Expect().default_value("level", "1").binding());
  EXPECT_EQ("the following arguments are required: --name", string(e.what()));
}

TEST_F(ValidatorTest, ConflictNamesFirstTwoInDeclarationOrder) {
  auto base = [] { return Expect().value("name", "n").default_value("level", "1"); };

  auto e = validation_error(spec, base().flag("z").flag("y").flag("x").binding());
  EXPECT_EQ(ErrorKind::conflicting_arguments, e.kind());
  EXPECT_EQ("x", e.argument());
  EXPECT_EQ("y", e.other_argument());
  EXPECT_EQ("xyz", e.group());
  EXPECT_EQ("argument -y: not allowed with argument -x", string(e.what()));

  // Symmetric: the order of occurrence does not matter
  auto e2 = validation_error(spec, base().flag("y").flag("x").binding());
  EXPECT_EQ(e.what(), string(e2.what()));
}

TEST_F(ValidatorTest, RequirementUnmet) {
  auto e = validation_error(spec, Expect().value("name", "n").default_value("level", "1")
                                      .value("password", "p").default_value("user", "root").binding());
  EXPECT_EQ(ErrorKind::group_requirement_unmet, e.kind());
  EXPECT_EQ("password", e.argument());
  EXPECT_EQ("user", e.other_argument());
  EXPECT_EQ("argument --password: requires argument --user", string(e.what()));
}

TEST_F(ValidatorTest, RequiredCheckedBeforeGroups) {
  auto e = validation_error(spec, Expect().flag("x").flag("y").value("password", "p").binding());
  EXPECT_EQ(ErrorKind::missing_required, e.kind());

  e = validation_error(spec, Expect().value("name", "n").default_value("level", "1")
                                 .flag("x").flag("y").value("password", "p").binding());
  EXPECT_EQ(ErrorKind::conflicting_arguments, e.kind());
}

TEST(ValidatorOneRequiredTest, Basic) {
  auto spec = build_spec(Declarations("prog")
                             .arg(ArgumentDecl::flag("add").long_name("add"))
                             .arg(ArgumentDecl::flag("remove").long_name("remove"))
                             .group(GroupDecl::one_required("action", {"add", "remove"})));
  EXPECT_NO_THROW(validate(spec, Expect().flag("remove").binding()));
  auto e = validation_error(spec, Binding());
  EXPECT_EQ(ErrorKind::group_requirement_unmet, e.kind());
  EXPECT_EQ("action", e.group());
  EXPECT_EQ("one of the arguments --add --remove is required", string(e.what()));
}

TEST(ValidatorSubcommandTest, OuterLevelFirst) {
  auto spec = build_spec(Declarations("prog")
                             .arg(ArgumentDecl::option("name").long_name("name").required())
                             .subcommand(Declarations("sub").arg(ArgumentDecl::option("id").long_name("id").required())));

  auto e = validation_error(spec, Expect().subcommand("sub", Expect()).binding());
  EXPECT_EQ("name", e.argument());
  EXPECT_EQ(spec.impl, e.spec().impl);

  e = validation_error(spec, Expect().value("name", "n").subcommand("sub", Expect()).binding());
  EXPECT_EQ("id", e.argument());
  EXPECT_EQ(spec.find_subcommand("sub")->impl, e.spec().impl);
}

TEST(ValidatorSubcommandTest, SubcommandRequired) {
  Settings settings;
  settings.subcommand_required = true;
  auto spec = build_spec(Declarations("prog").settings(settings).subcommand(Declarations("sub")));
  EXPECT_NO_THROW(validate(spec, Expect().subcommand("sub", Expect()).binding()));
  auto e = validation_error(spec, Binding());
  EXPECT_EQ(ErrorKind::missing_required, e.kind());
  EXPECT_EQ("<SUBCOMMAND>", e.display_name());
}

} // namespace

} // namespace argmatch
