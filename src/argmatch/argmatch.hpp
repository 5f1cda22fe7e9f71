#ifndef HEADER_GUARD_7b78812fafc42519b15127c348896391
#define HEADER_GUARD_7b78812fafc42519b15127c348896391

/**
 * \file
 * \brief Declarative command-line matching
 *
 * A program describes its command line with \ref argmatch::Declarations, validates them once with \ref argmatch::build_spec, and then matches argument lists with \ref argmatch::parse or \ref argmatch::try_parse.
 **/

#include "./binding.hpp"
#include "./error.hpp"
#include "./help.hpp"
#include "./parse.hpp"
#include "./spec.hpp"

#endif /* HEADER GUARD */
