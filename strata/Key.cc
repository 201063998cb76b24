/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Key.h"
#include "strings.h"

using namespace std;


vector<string>
strata::parseKeys (const vector<Key> & keys)
{
    vector<string> result;
    result.reserve (keys.size ());
    for (auto & k : keys)
    {
        for (auto & segment : split (k.text, ".")) result.push_back (segment);
    }
    return result;
}
