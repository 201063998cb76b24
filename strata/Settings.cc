/*
Settings engine: evaluates switch-like rule groups against a context node.

A group looks like this:
    settings.images.1.keys.1=?category
    settings.images.1.false.value=max:0
    settings.images.2.keys.1=category
    settings.images.2.1001.value=max:12,extra:4
    settings.images.3.default=max:8
Cases are tried in child order. The first case that produces a payload ends
the group, unless it carries continue=1.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Node.h"
#include "strings.h"

using namespace std;


/**
    Splits a payload such as "max:12,comment:Easy as 1\,2\,3" into reply entries.
    Commas and colons may be escaped with a backslash.
**/
static void
appendPayload (strata::Reply & reply, const string & payload, bool usePrefix, const string & prefix)
{
    for (auto & item : strata::splitEscaped (payload, ",", "\\"))
    {
        vector<string> parts = strata::splitEscaped (item, ":", "\\", 2);
        string subkey = "value";
        string value  = parts[0];
        if (parts.size () == 2)
        {
            subkey = parts[0];
            value  = parts[1];
        }

        if (usePrefix)
        {
            if (subkey == "value") subkey = prefix;
            else                   subkey = prefix + "_" + subkey;
        }
        reply.add (subkey, value);
    }
}

strata::Reply
strata::Node::getSettings (const vector<Key> & keys)
{
    Reply reply;
    vector<string> path = parseKeys (keys);
    if (this == &none  ||  path.empty ()) return reply;

    bool usePrefix = path.back () == "*";
    for (Node * group : resolve (path))
    {
        string prefix;
        if (usePrefix) prefix = group->name;

        for (Node * c : group->getNodes ("*"))
        {
            bool matched = false;
            // Control entries are exact children. A "*" case child must not stand in for them.
            Node & defaultNode = c->child ("default");
            Node & keysNode    = c->child ("keys");
            if (&defaultNode != &none)
            {
                appendPayload (reply, defaultNode.content.toString (), usePrefix, prefix);
                matched = true;
            }
            else if (&keysNode != &none)
            {
                vector<Key> selector;
                for (auto & wanted : keysNode.getStringValues ("*"))
                {
                    if (! wanted.empty ()  &&  wanted[0] == '?')
                    {
                        Node & probe = getNode (wanted.substr (1));
                        selector.push_back (&probe == &none ? "false" : "true");
                    }
                    else
                    {
                        selector.push_back (get (wanted));  // A missing key gives an empty segment, which only a "*" case can match.
                    }
                }
                selector.push_back ("value");

                Node & selected = c->getNode (selector);
                if (&selected != &none)
                {
                    appendPayload (reply, selected.content.toString (), usePrefix, prefix);
                    matched = true;
                }
            }

            if (! matched) continue;
            bool proceed = false;
            if (! c->child ("continue").content.toBool (proceed)  ||  ! proceed) break;
        }
    }
    return reply;
}
