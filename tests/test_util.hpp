#pragma once

#include "gff/gff.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

// Run `fn` and return the kind of the GffError it throws. Anything else
// (including no throw) fails the calling test.
template <typename Fn>
static gff::ErrorKind error_kind_of(Fn&& fn, gff::GffRegion* region = nullptr) {
    try {
        fn();
    } catch (const gff::GffError& e) {
        if (region) *region = e.region();
        return e.kind();
    }
    throw std::runtime_error("expected a GffError, nothing was thrown");
}

#define CHECK_THROWS_KIND(expr, kind) \
    CHECK(error_kind_of([&] { (void)(expr); }) == (kind))
