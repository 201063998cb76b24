/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_nodelist_h
#define strata_nodelist_h

#include "Value.h"

#include <vector>
#include <string>
#include <functional>

#include "shared.h"


namespace strata
{
    class SHARED Node;

    /**
        Result of a path query. Holds non-owning pointers into the tree, in match order.
        The pointers remain valid only as long as the matched nodes stay attached.
    **/
    class SHARED NodeList : public std::vector<Node *>
    {
    public:
        /**
            Replaces the value of each node whose key is one of the given keys
            (or of every node, if no keys are given) with the result of conv.
        **/
        NodeList & convertValues (std::function<Value (Node &)> conv, const std::vector<std::string> & keys = std::vector<std::string> ());

        NodeList & valuesToString   (const std::vector<std::string> & keys = std::vector<std::string> ());
        NodeList & valuesToInt      (const std::vector<std::string> & keys = std::vector<std::string> ());
        NodeList & valuesToFloat    (const std::vector<std::string> & keys = std::vector<std::string> ());
        NodeList & valuesToBool     (const std::vector<std::string> & keys = std::vector<std::string> ());
        NodeList & valuesToDuration (const std::vector<std::string> & keys = std::vector<std::string> ());

        std::vector<Value> forEach       (std::function<Value (Node &)> f) const;
        NodeList           filter        (std::function<bool (Node &)> f) const;
        NodeList           filterByValue (const Value & value) const;
        Node *             first         () const;  ///< nullptr if empty
    };
}

#endif
