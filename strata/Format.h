/*
Readers and writers that move configuration trees in and out of streams.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_format_h
#define strata_format_h

#include "Node.h"

#include <string>
#include <set>
#include <iostream>

#include "shared.h"


namespace strata
{
    class SHARED Format
    {
    public:
        virtual ~Format ();

        /**
            Merges the contents of the stream under the given node.
            Keys already present in node are overwritten by matching entries in the stream.
            On a format error, writes the reason to stderr and throws.
        **/
        virtual void read (Node & node, std::istream & reader) = 0;

        /**
            Writes node and its descendants.
        **/
        virtual void write (const Node & node, std::ostream & writer) = 0;
    };

    /**
        Line-oriented "key=value" files:
        <pre>
        # comment
        include common.conf
        server.port:int = 8080
        server.hosts:[]string = alpha,beta\,gamma
        </pre>
        Keys are dotted paths. An optional ":type" suffix on the key parses the value as
        string, int, float, bool, duration, date or time, and a "[]" before the type
        makes a comma-separated list. Blank lines and lines starting with "#" are ignored.
    **/
    class SHARED FormatText : public Format
    {
    public:
        bool stopOnErrors;  ///< If false, read() skips unrecognized lines instead of throwing.

        FormatText (bool stopOnErrors = true);

        /**
            Reads entries from a stream. Include directives are not allowed here.
        **/
        virtual void read (Node & node, std::istream & reader);

        /**
            Writes one "path=value" line for each node without children.
        **/
        virtual void write (const Node & node, std::ostream & writer);

        /**
            Reads a file along with everything it includes. Relative include paths are
            resolved against the directory of the including file. A file that was already
            loaded through this object is skipped, which also breaks include cycles.
            Any error, including in an unrecognized line, throws.
        **/
        void readFile (Node & node, const std::string & filename);

    protected:
        std::set<std::string> seen;  ///< Absolute paths of files already loaded

        /**
            Interprets a single line that is neither blank nor a comment.
            @return false if the line is not a well-formed entry.
            @param error Receives a reason when the entry is well formed but its value
            does not parse as the declared type.
        **/
        bool parseEntry (Node & node, const std::string & line, const char * & error);
    };

    /**
        Strips the trailing CR from a line read with getline(), so files written on
        any platform read the same.
    **/
    SHARED void getLine (std::istream & reader, std::string & line);
}

#endif
