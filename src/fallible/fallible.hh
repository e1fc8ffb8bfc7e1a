#pragma once

// Convenience header including the whole library

#include <fallible/any_error.hh>
#include <fallible/attempt.hh>
#include <fallible/errors.hh>
#include <fallible/match.hh>
#include <fallible/maybe_block.hh>
#include <fallible/option.hh>
#include <fallible/result.hh>
#include <fallible/try_block.hh>
