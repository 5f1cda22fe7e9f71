#ifndef HEADER_GUARD_224f82b46b2581e195534be1230a034f
#define HEADER_GUARD_224f82b46b2581e195534be1230a034f

#include "./error.hpp"
#include "./spec.hpp"

namespace argmatch {

/**
 * \brief Formats the diagnostic for \p error: the usage of the failing level followed by \p "<prog>: error: <message>"
 **/
string error_string(ParseError const &error, HelpFormatterParameters const &params = {});

/**
 * \brief Formats the invocation shown for a subcommand in help text, e.g. \p "remove (rm, del)"
 **/
string format_subcommand_invocation(SpecModel const &sub);

} // namespace argmatch

#endif /* HEADER GUARD */
