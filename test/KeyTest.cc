/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "strata/Key.h"
#include "strata/strings.h"

#include <gtest/gtest.h>

using namespace strata;
using namespace std;


TEST (KeyTest, MixedKeysFlatten)
{
    vector<string> expected {"a", "1", "true", "3", "5"};
    EXPECT_EQ (expected, parseKeys ({"a", 1, true, 3.5}));
}

TEST (KeyTest, DotsSplitSegments)
{
    vector<string> expected {"main", "sub", "leaf", "2"};
    EXPECT_EQ (expected, parseKeys ({"main.sub", string ("leaf"), 2l}));
}

TEST (KeyTest, EmptyList)
{
    EXPECT_TRUE (parseKeys ({}).empty ());
}

TEST (KeyTest, EmptySegmentsAreKept)
{
    vector<string> expected {"a", "", "b"};
    EXPECT_EQ (expected, parseKeys ({"a..b"}));
}

TEST (KeyTest, ValueKey)
{
    vector<string> expected {"1001", "value"};
    EXPECT_EQ (expected, parseKeys ({Value (1001), "value"}));
}

TEST (StringsTest, SplitEscaped)
{
    vector<string> expected {"max:0", "comment:Easy as 1,2,3"};
    EXPECT_EQ (expected, splitEscaped ("max:0,comment:Easy as 1\\,2\\,3", ",", "\\"));

    vector<string> pair {"extra", "price:5"};
    EXPECT_EQ (pair, splitEscaped ("extra:price:5", ":", "\\", 2));

    vector<string> single {"value"};
    EXPECT_EQ (single, splitEscaped ("value", ":", "\\", 2));

    vector<string> trailing {"a", ""};
    EXPECT_EQ (trailing, splitEscaped ("a,", ",", "\\"));
}

TEST (StringsTest, Trim)
{
    EXPECT_EQ ("a b", trim ("  a b \t"));
    EXPECT_EQ ("",    trim ("   "));
}
