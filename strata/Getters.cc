/*
Typed accessors on Node.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Node.h"
#include "strings.h"

using namespace std;


static const char * const notFound = "node not found";

/**
    Reports a failed must-style lookup and throws.
**/
static void
required (const vector<strata::Key> & keys, const char * reason)
{
    cerr << "Required conf key " << strata::join (".", strata::parseKeys (keys)) << ": " << reason << endl;
    throw "Required configuration key is missing or malformed";
}


// Node lookup ---------------------------------------------------------------

strata::Node &
strata::Node::getNode (const vector<Key> & keys)
{
    return find (parseKeys (keys));
}

strata::Node &
strata::Node::getNodeOrDefault (Node & defaultValue, const vector<Key> & keys)
{
    Node & result = getNode (keys);
    if (&result == &none) return defaultValue;
    return result;
}

const char *
strata::Node::tryGetNode (Node * & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    result = &n;
    return nullptr;
}


// Try getters ---------------------------------------------------------------

const char *
strata::Node::tryGet (Value & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    result = n.content;
    return nullptr;
}

const char *
strata::Node::tryGet (string & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    result = n.content.toString ();
    return nullptr;
}

const char *
strata::Node::tryGet (int & result, const vector<Key> & keys)
{
    long value;
    const char * error = tryGet (value, keys);
    if (error) return error;
    result = (int) value;
    return nullptr;
}

const char *
strata::Node::tryGet (long & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    int64_t value;
    if (! n.content.toInt (value)) return Value::badValue;
    result = value;
    return nullptr;
}

const char *
strata::Node::tryGet (double & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    if (! n.content.toFloat (result)) return Value::badValue;
    return nullptr;
}

const char *
strata::Node::tryGet (bool & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    if (! n.content.toBool (result)) return Value::badValue;
    return nullptr;
}

const char *
strata::Node::tryGet (Duration & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    if (! n.content.toDuration (result)) return Value::badDuration;
    return nullptr;
}

const char *
strata::Node::tryGet (Time & result, const vector<Key> & keys)
{
    Node & n = getNode (keys);
    if (&n == &none) return notFound;
    if (! n.content.toTime (result)) return Value::badTime;
    return nullptr;
}


// Plain getters -------------------------------------------------------------

strata::Value
strata::Node::get (const vector<Key> & keys)
{
    Value result;
    tryGet (result, keys);
    return result;
}

string
strata::Node::getString (const vector<Key> & keys)
{
    string result;
    tryGet (result, keys);
    return result;
}

int
strata::Node::getInt (const vector<Key> & keys)
{
    return getOrDefault (0, keys);
}

long
strata::Node::getLong (const vector<Key> & keys)
{
    return getOrDefault (0l, keys);
}

double
strata::Node::getDouble (const vector<Key> & keys)
{
    return getOrDefault (0.0, keys);
}

bool
strata::Node::getBool (const vector<Key> & keys)
{
    return getOrDefault (false, keys);
}

strata::Duration
strata::Node::getDuration (const vector<Key> & keys)
{
    return getOrDefault (Duration::zero (), keys);
}

strata::Time
strata::Node::getTime (const vector<Key> & keys)
{
    return getOrDefault (Time (), keys);
}


// Default getters -----------------------------------------------------------
// The try getters leave result untouched on failure, so the default passes straight through.

string
strata::Node::getOrDefault (const char * defaultValue, const vector<Key> & keys)
{
    string result = defaultValue ? defaultValue : "";
    tryGet (result, keys);
    return result;
}

string
strata::Node::getOrDefault (const string & defaultValue, const vector<Key> & keys)
{
    string result = defaultValue;
    tryGet (result, keys);
    return result;
}

int
strata::Node::getOrDefault (int defaultValue, const vector<Key> & keys)
{
    int result = defaultValue;
    tryGet (result, keys);
    return result;
}

long
strata::Node::getOrDefault (long defaultValue, const vector<Key> & keys)
{
    long result = defaultValue;
    tryGet (result, keys);
    return result;
}

double
strata::Node::getOrDefault (double defaultValue, const vector<Key> & keys)
{
    double result = defaultValue;
    tryGet (result, keys);
    return result;
}

bool
strata::Node::getOrDefault (bool defaultValue, const vector<Key> & keys)
{
    bool result = defaultValue;
    tryGet (result, keys);
    return result;
}

strata::Duration
strata::Node::getOrDefault (Duration defaultValue, const vector<Key> & keys)
{
    Duration result = defaultValue;
    tryGet (result, keys);
    return result;
}

strata::Time
strata::Node::getOrDefault (Time defaultValue, const vector<Key> & keys)
{
    Time result = defaultValue;
    tryGet (result, keys);
    return result;
}

strata::Value
strata::Node::getValueOrDefault (const Value & defaultValue, const vector<Key> & keys)
{
    Value result = defaultValue;
    tryGet (result, keys);
    return result;
}


// Must getters --------------------------------------------------------------

strata::Node &
strata::Node::mustGetNode (const vector<Key> & keys)
{
    Node * result = nullptr;
    const char * error = tryGetNode (result, keys);
    if (error) required (keys, error);
    return *result;
}

strata::Value
strata::Node::mustGet (const vector<Key> & keys)
{
    Value result;
    const char * error = tryGet (result, keys);
    if (error) required (keys, error);
    return result;
}

string
strata::Node::mustGetString (const vector<Key> & keys)
{
    string result;
    const char * error = tryGet (result, keys);
    if (error) required (keys, error);
    return result;
}

int
strata::Node::mustGetInt (const vector<Key> & keys)
{
    int result = 0;
    const char * error = tryGet (result, keys);
    if (error) required (keys, error);
    return result;
}

double
strata::Node::mustGetDouble (const vector<Key> & keys)
{
    double result = 0;
    const char * error = tryGet (result, keys);
    if (error) required (keys, error);
    return result;
}

bool
strata::Node::mustGetBool (const vector<Key> & keys)
{
    bool result = false;
    const char * error = tryGet (result, keys);
    if (error) required (keys, error);
    return result;
}

strata::Duration
strata::Node::mustGetDuration (const vector<Key> & keys)
{
    Duration result = Duration::zero ();
    const char * error = tryGet (result, keys);
    if (error) required (keys, error);
    return result;
}

strata::Time
strata::Node::mustGetTime (const vector<Key> & keys)
{
    Time result;
    const char * error = tryGet (result, keys);
    if (error) required (keys, error);
    return result;
}


// Collections ---------------------------------------------------------------

vector<strata::Value>
strata::Node::getValues (const vector<Key> & keys)
{
    vector<Value> result;
    for (Node * n : getNodes (keys))
    {
        if (n->isLeaf ()) result.push_back (n->content);
    }
    return result;
}

vector<string>
strata::Node::getStringValues (const vector<Key> & keys)
{
    vector<string> result;
    for (Node * n : getNodes (keys)) result.push_back (n->content.toString ());
    return result;
}

strata::Args
strata::Node::getMap (const vector<Key> & keys)
{
    vector<string> path = parseKeys (keys);
    if (path.empty ()) path.push_back ("*");

    size_t lastStar = 0;
    for (size_t i = 0; i < path.size (); i++) if (path[i] == "*") lastStar = i;
    vector<string> head (path.begin (), path.begin () + lastStar + 1);
    vector<string> tail (path.begin () + lastStar + 1, path.end ());

    Args result;
    for (Node * n : resolve (head))
    {
        Node * target = n;
        if (! tail.empty ()) target = & n->find (tail);
        if (target == &none) continue;
        result[n->name] = target->content.toString ();
    }
    return result;
}

strata::StrArgs
strata::Node::getStringMap (const vector<Key> & keys)
{
    StrArgs result;
    for (auto & it : getMap (keys)) result[it.first] = it.second.toString ();
    return result;
}
