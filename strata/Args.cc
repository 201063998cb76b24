/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Args.h"

using namespace std;


strata::Args &
strata::Args::merge (const Args & other)
{
    for (auto & it : other) (*this)[it.first] = it.second;
    return *this;
}

strata::Args
strata::Args::clone () const
{
    return *this;
}

strata::Args
strata::Args::add (const Args & other) const
{
    return clone ().merge (other);
}

string
strata::Args::getString (const string & key) const
{
    const_iterator it = find (key);
    if (it == end ()) return "";
    return it->second.toString ();
}
