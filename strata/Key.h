/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_key_h
#define strata_key_h

#include "Value.h"

#include <string>
#include <vector>

#include "shared.h"


namespace strata
{
    /**
        One element of a key list, as passed to the variadic accessors of Node.
        Anything with a natural text form converts implicitly, so callers may write
        node.get ("servers", 1, "name") or node.get ("servers.1.name") interchangeably.
    **/
    struct SHARED Key
    {
        std::string text;

        Key (const char *        value) : text (value ? value : "")           {}
        Key (const std::string & value) : text (value)                        {}
        Key (int                 value) : text (std::to_string (value))       {}
        Key (long                value) : text (std::to_string (value))       {}
        Key (long long           value) : text (std::to_string (value))       {}
        Key (unsigned int        value) : text (std::to_string (value))       {}
        Key (unsigned long       value) : text (std::to_string (value))       {}
        Key (double              value) : text (Value::formatFloat (value))   {}
        Key (bool                value) : text (value ? "true" : "false")     {}
        Key (const Value &       value) : text (value.toString ())            {}
    };

    /**
        Flattens a key list into path segments. The text of every key is split on ".",
        so {"a.b", 1, true, 3.5} becomes a, b, 1, true, 3, 5.
        An empty list produces an empty path.
    **/
    SHARED std::vector<std::string> parseKeys (const std::vector<Key> & keys);
}

#endif
