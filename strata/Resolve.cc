/*
Path resolution across stacked scopes.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Node.h"

using namespace std;


/**
    Depth-first match of path[index..] against the children of this node.
    @return true once the result has reached limit, which ends the whole search.
**/
bool
strata::Node::matchPath (const vector<string> & path, size_t index, size_t limit, NodeList & result)
{
    const string & k = path[index];
    if (k == "*")
    {
        for (auto & o : order)
        {
            if (matchChild (*children[o], path, index, limit, result)) return true;
        }
        return false;
    }

    auto it = children.find (k);
    if (it != children.end ()  &&  matchChild (*it->second, path, index, limit, result)) return true;

    // A child literally named "*" stands in for any key.
    it = children.find ("*");
    if (it != children.end ()  &&  matchChild (*it->second, path, index, limit, result)) return true;
    return false;
}

bool
strata::Node::matchChild (Node & c, const vector<string> & path, size_t index, size_t limit, NodeList & result)
{
    if (index + 1 < path.size ()) return c.matchPath (path, index + 1, limit, result);
    result.push_back (&c);
    return limit  &&  result.size () >= limit;
}

strata::NodeList
strata::Node::resolve (const vector<string> & path, int limit)
{
    NodeList result;
    if (this == &none) return result;
    if (path.empty ())
    {
        result.push_back (this);
        return result;
    }

    size_t         count = limit > 0 ? limit : 0;
    Node *         n     = this;
    vector<string> p     = path;
    while (true)
    {
        if (n->matchPath (p, 0, count, result)) break;

        Node * inherited = n->root ().scope;
        if (! inherited) break;
        if (! (n->flags & IsRoot))
        {
            // Re-anchor at the inherited root by prefixing the absolute position of n.
            vector<string> absolute = n->keyPath ();
            absolute.insert (absolute.end (), p.begin (), p.end ());
            p.swap (absolute);
        }
        n = inherited;
    }
    return result;
}

strata::Node &
strata::Node::find (const vector<string> & path)
{
    NodeList found = resolve (path, 1);
    if (found.empty ()) return none;
    return *found[0];
}

strata::NodeList
strata::Node::getNodes (const vector<Key> & keys)
{
    return resolve (parseKeys (keys));
}
