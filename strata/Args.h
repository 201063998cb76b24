/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_args_h
#define strata_args_h

#include "Value.h"

#include <map>
#include <string>
#include <initializer_list>

#include "shared.h"


namespace strata
{
    /**
        Key/value pairs used to populate a tree, as in Node::fromArgs() and Node::with().
        Keys may be dotted paths.
    **/
    class SHARED Args : public std::map<std::string, Value>
    {
    public:
        Args () {}
        Args (std::initializer_list<value_type> entries) : std::map<std::string, Value> (entries) {}

        Args & merge (const Args & other);        ///< Adds or overwrites the entries of other. Returns this.
        Args   clone () const;
        Args   add   (const Args & other) const;  ///< A copy of this, merged with other.

        /// @return The string form of the value under key, or "" if key is absent.
        std::string getString (const std::string & key) const;
    };
}

#endif
