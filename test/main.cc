//
// doctest runner for litfix
//
// Test cases live in test/<area>/test_*.cc and register themselves when
// linked into this executable.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>
