/*
 * Copyright (C) 2026 Swift Navigation Inc.
 * Contact: Swift Navigation <dev@swiftnav.com>
 *
 * This source is subject to the license found in the file 'LICENSE' which must
 * be distributed together with this source. All other rights reserved.
 *
 * THIS CODE AND INFORMATION IS PROVIDED "AS IS" WITHOUT WARRANTY OF ANY KIND,
 * EITHER EXPRESSED OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND/OR FITNESS FOR A PARTICULAR PURPOSE.
 */

#ifndef MONACO_SRC_DETAILS_ERROR_HANDLING_HPP_
#define MONACO_SRC_DETAILS_ERROR_HANDLING_HPP_

/*
 * assert() behaves differently in debug and release mode, which makes
 * something like:
 *
 *   assert(function_with_side_effects());
 *
 * dangerous.  MONACO_ASSERT always evaluates its argument and only
 * checks the result in debug builds.  It is reserved for internal
 * invariants, user facing problems raise a ConfigurationError instead.
 */
#ifdef NDEBUG
#define MONACO_ASSERT(x)                                                       \
  do {                                                                         \
    (void)(x);                                                                 \
  } while (0)
#else
#include <assert.h>
#define MONACO_ASSERT(x) assert((x))
#endif

namespace monaco {

/*
 * Raised while constructing a sampler (or one of its collaborators)
 * from arguments which could never produce a valid run.  Problems
 * with individual particles during a run are never reported this way,
 * they are contained and counted in the run history instead.
 */
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

#define MONACO_CONFIG_CHECK(condition, message)                                \
  do {                                                                         \
    if (!(condition)) {                                                        \
      throw ::monaco::ConfigurationError(message);                             \
    }                                                                          \
  } while (0)

} // namespace monaco

#endif /* MONACO_SRC_DETAILS_ERROR_HANDLING_HPP_ */
