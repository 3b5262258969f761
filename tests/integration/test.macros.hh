#pragma once

#include "macros.hh"

#define EXPECT_EQ(T, a, b)                                                     \
    EXPECT((T)(a) == (T)(b),                                                   \
           "Expected ",                                                        \
           #a,                                                                 \
           " == ",                                                             \
           #b,                                                                 \
           ", but ",                                                           \
           (T)(a),                                                             \
           " != ",                                                             \
           (T)(b))
