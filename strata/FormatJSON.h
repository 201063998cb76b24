/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_format_json_h
#define strata_format_json_h

#include "Format.h"

#include "shared.h"


namespace strata
{
    /**
        JSON view of a tree.

        <p>On output, a node without children is written as its value. A node whose keys
        are all integers is written as an array in child order, unless it carries the
        ForceMap flag. ForceArray always selects an array. Everything else becomes an
        object in child order. Durations are written as integer nanoseconds and times as
        RFC3339 strings.

        <p>On input, the document must be an object. Nested objects become children,
        arrays become children keyed 1 through n, and scalars are set through the key
        path. Dots inside member names split into further levels.
    **/
    class SHARED FormatJSON : public Format
    {
    public:
        virtual void read (Node & node, std::istream & reader);
        virtual void write (const Node & node, std::ostream & writer);

        std::string toString (const Node & node);
    };
}

#endif
