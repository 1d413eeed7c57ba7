//
// Unit tests for buffer rebuilding
//

#include <doctest/doctest.h>
#include <litfix/errors.hh>
#include <litfix/span.hh>
#include <string>
#include <vector>

using namespace litfix;

TEST_SUITE("Apply Rewrites") {
    TEST_CASE("Rewrites are applied in position order") {
        std::vector<rewrite> rewrites{{{4, 5}, "X"}, {{1, 2}, "Y"}};
        CHECK(apply_rewrites("abcdef", rewrites) == "aYcdXf");
    }

    TEST_CASE("No rewrites returns the buffer") {
        CHECK(apply_rewrites("abc", {}) == "abc");
    }

    TEST_CASE("Insertion precedes a replacement at the same position") {
        std::vector<rewrite> rewrites{{{2, 4}, "Z"}, {{2, 2}, "I"}};
        CHECK(apply_rewrites("abcdef", rewrites) == "abIZef");
    }

    TEST_CASE("Insertions at one position keep their order") {
        std::vector<rewrite> rewrites{{{0, 0}, "1"}, {{0, 0}, "2"}, {{6, 6}, "!"}};
        CHECK(apply_rewrites("abcdef", rewrites) == "12abcdef!");
    }

    TEST_CASE("Overlapping rewrites are rejected") {
        std::vector<rewrite> rewrites{{{1, 3}, ""}, {{2, 4}, ""}};
        CHECK_THROWS_AS(apply_rewrites("abcdef", rewrites), litfix_error);
    }

    TEST_CASE("Spans outside the buffer are rejected") {
        std::vector<rewrite> rewrites{{{4, 9}, ""}};
        CHECK_THROWS_AS(apply_rewrites("abcdef", rewrites), litfix_error);
    }
}
