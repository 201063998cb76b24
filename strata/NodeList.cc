/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "NodeList.h"
#include "Node.h"

#include <algorithm>

using namespace std;


strata::NodeList &
strata::NodeList::convertValues (function<Value (Node &)> conv, const vector<string> & keys)
{
    for (Node * n : *this)
    {
        if (keys.empty ()  ||  std::find (keys.begin (), keys.end (), n->key ()) != keys.end ()) n->set (conv (*n));
    }
    return *this;
}

strata::NodeList &
strata::NodeList::valuesToString (const vector<string> & keys)
{
    return convertValues ([] (Node & n) {return Value (n.getString ());}, keys);
}

strata::NodeList &
strata::NodeList::valuesToInt (const vector<string> & keys)
{
    return convertValues ([] (Node & n) {return Value (n.getLong ());}, keys);
}

strata::NodeList &
strata::NodeList::valuesToFloat (const vector<string> & keys)
{
    return convertValues ([] (Node & n) {return Value (n.getDouble ());}, keys);
}

strata::NodeList &
strata::NodeList::valuesToBool (const vector<string> & keys)
{
    return convertValues ([] (Node & n) {return Value (n.getBool ());}, keys);
}

strata::NodeList &
strata::NodeList::valuesToDuration (const vector<string> & keys)
{
    return convertValues ([] (Node & n) {return Value (n.getDuration ());}, keys);
}

vector<strata::Value>
strata::NodeList::forEach (function<Value (Node &)> f) const
{
    vector<Value> result;
    result.reserve (size ());
    for (Node * n : *this) result.push_back (f (*n));
    return result;
}

strata::NodeList
strata::NodeList::filter (function<bool (Node &)> f) const
{
    NodeList result;
    for (Node * n : *this) if (f (*n)) result.push_back (n);
    return result;
}

strata::NodeList
strata::NodeList::filterByValue (const Value & value) const
{
    return filter ([&value] (Node & n) {return n.value () == value;});
}

strata::Node *
strata::NodeList::first () const
{
    if (empty ()) return nullptr;
    return front ();
}
