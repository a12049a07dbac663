
#ifndef SHOTFORM__x__STDINC_HPP
#define SHOTFORM__x__STDINC_HPP

// Keep this small
#include "shotform/foundation.hpp"

#ifdef __cplusplus

#include "shotform/utils/math.hpp"
#include "shotform/utils/string-utils.hpp"

#include "shotform/geometry/vector-2.hpp"
#include <string_view>

#endif

#endif
