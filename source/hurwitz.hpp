#pragma once

#include "format.hpp"      // IWYU pragma: keep
#include "polynomial.hpp"  // IWYU pragma: keep
#include "routh.hpp"       // IWYU pragma: keep
#include "sweep.hpp"       // IWYU pragma: keep
#include "types.hpp"       // IWYU pragma: keep
