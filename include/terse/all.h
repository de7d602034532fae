/***
 * Name: terse umbrella header
 * Purpose: Aggregate the public terse library headers for callers that want everything.
 */
#pragma once

#include "terse/collections/dictionaries.h"
#include "terse/collections/emptiness.h"
#include "terse/collections/filtering.h"
#include "terse/collections/for_each.h"
#include "terse/collections/mapping.h"
#include "terse/collections/range.h"
#include "terse/collections/reducing.h"
#include "terse/collections/sorting.h"
#include "terse/defaults/defaultable.h"
#include "terse/exceptions/invalid_argument_error.h"
#include "terse/exceptions/terse_exception.h"
#include "terse/exceptions/unexpected_nil_error.h"
#include "terse/math/constants.h"
#include "terse/math/floats.h"
#include "terse/math/parity.h"
#include "terse/math/powers.h"
#include "terse/math/roots.h"
#include "terse/math/signs.h"
#include "terse/optional/optionals.h"
#include "terse/strings/describe.h"
#include "terse/strings/type_name.h"
#include "terse/strings/unicode.h"
#include "terse/time/dates.h"
