/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Reply.h"
#include "Value.h"
#include "strings.h"

using namespace std;


static bool
isError (const string & value)
{
    return value.compare (0, 6, "ERROR_") == 0;
}

void
strata::Reply::set (const string & key, const vector<string> & values)
{
    (*this)[key] = values;
}

void
strata::Reply::add (const string & key, const vector<string> & values)
{
    vector<string> & target = (*this)[key];
    target.insert (target.end (), values.begin (), values.end ());
}

void
strata::Reply::add (const string & key, const string & value)
{
    (*this)[key].push_back (value);
}

string
strata::Reply::get (const string & key) const
{
    auto it = find (key);
    if (it == end ()  ||  it->second.empty ()) return "";
    return it->second[0];
}

int
strata::Reply::getInt (const string & key) const
{
    int64_t result;
    if (Value::parseInt (get (key), result)) return (int) result;
    return 0;
}

bool
strata::Reply::getBool (const string & key) const
{
    string value = toLowerCase (get (key));
    return value == "1"  ||  value == "t"  ||  value == "true"  ||  value == "on";
}

strata::Reply
strata::Reply::errors () const
{
    Reply result;
    for (auto & it : *this)
    {
        for (auto & value : it.second)
        {
            if (isError (value)) result.add (it.first, value);
        }
    }
    return result;
}

string
strata::Reply::errorReason () const
{
    if (get ("status") == "TRANS_OK") return "";
    for (auto & it : errors ())
    {
        if (! it.second.empty ()) return it.second[0];
    }
    return "TRANS_ERROR";
}
