#ifndef __PTYHOST_TEST_HEADERS__
#define __PTYHOST_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch.hpp>

#endif  // __PTYHOST_TEST_HEADERS__
