#ifndef HEADER_GUARD_34223ead5cb26d23410bfadff5354fbe
#define HEADER_GUARD_34223ead5cb26d23410bfadff5354fbe

#include "./binding.hpp"
#include "./spec.hpp"

namespace argmatch {

/**
 * \brief Checks the required arguments and group constraints of a single level.
 *
 * An argument counts as present for group checks only if it occurred on the command line; default values do not count.
 *
 * \throws ParseError with category ErrorCategory::validation on the first violation
 **/
void validate_level(SpecModel const &spec, Binding const &binding);

/**
 * \brief Validates \p binding and each nested subcommand binding, from the outermost level inward
 **/
void validate(SpecModel const &spec, Binding const &binding);

} // namespace argmatch

#endif /* HEADER GUARD */
