/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Format.h"

#include <regex>
#include <fstream>
#include <memory>
#include <iostream>
#include <climits>
#include <cstdlib>

using namespace std;


static const regex ignoreLine  ("^\\s*(#.*)?$");
static const regex includeLine ("^\\s*include ([^\\s]+)\\s*$");
static const regex entryLine   ("^\\s*([^=\\s][^=]*?)(?::((?:\\[\\])?(?:string|int|float|bool|duration|date|time)))?\\s*=\\s*(.*?)\\s*$");


// Utility functions ---------------------------------------------------------

void
strata::getLine (istream & reader, string & line)
{
    getline (reader, line);  // default line ending is NL
    int count = line.size ();
    if (count  &&  line[count-1] == '\r') line.resize (count - 1);  // Get rid of CR. Should work for every platform except older MacOS.
}

static string
absolutePath (const string & filename)
{
    char buffer[PATH_MAX];
    if (realpath (filename.c_str (), buffer)) return buffer;
    return filename;  // Nonexistent file. Opening it will fail and report the name as given.
}


// class Format --------------------------------------------------------------

strata::Format::~Format ()
{
}


// class FormatText ----------------------------------------------------------

strata::FormatText::FormatText (bool stopOnErrors)
:   stopOnErrors (stopOnErrors)
{
}

bool
strata::FormatText::parseEntry (Node & node, const string & line, const char * & error)
{
    smatch matches;
    if (! regex_match (line, matches, entryLine)) return false;

    Value value;
    error = Value::parse (matches.str (2), matches.str (3), value);
    if (! error) node.set (value, matches.str (1));
    return true;
}

void
strata::FormatText::read (Node & node, istream & reader)
{
    string line;
    int    lineNumber = 0;
    while (reader.good ())
    {
        getLine (reader, line);
        if (reader.fail ()) break;
        lineNumber++;
        if (regex_match (line, ignoreLine)) continue;

        const char * error = nullptr;
        if (parseEntry (node, line, error))
        {
            if (error)
            {
                cerr << "line " << lineNumber << ": " << error << ": \"" << line << "\"" << endl;
                throw "Bad value in configuration stream";
            }
        }
        else if (stopOnErrors)
        {
            cerr << "line " << lineNumber << ": bad format: \"" << line << "\"" << endl;
            throw "Bad format in configuration stream";
        }
    }
}

void
strata::FormatText::write (const Node & node, ostream & writer)
{
    node.dump (writer, false);
}

void
strata::FormatText::readFile (Node & node, const string & filename)
{
    string fullPath = absolutePath (filename);
    if (seen.count (fullPath)) return;
    seen.insert (fullPath);

    ifstream reader (filename.c_str ());
    if (! reader.good ())
    {
        cerr << "Failed to open " << filename << endl;
        throw "Failed to open configuration file";
    }

    string directory;
    size_t slash = filename.find_last_of ('/');
    if (slash != string::npos) directory = filename.substr (0, slash + 1);

    string line;
    int    lineNumber = 0;
    while (reader.good ())
    {
        getLine (reader, line);
        if (reader.fail ()) break;
        lineNumber++;
        if (regex_match (line, ignoreLine)) continue;

        smatch matches;
        if (regex_match (line, matches, includeLine))
        {
            string include = matches.str (1);
            if (include[0] != '/') include = directory + include;
            try
            {
                readFile (node, include);
            }
            catch (const char *)
            {
                cerr << filename << ":" << lineNumber << ": including \"" << include << "\"" << endl;
                throw;
            }
            continue;
        }

        const char * error = nullptr;
        if (! parseEntry (node, line, error))
        {
            cerr << filename << ":" << lineNumber << ": bad format: \"" << line << "\"" << endl;
            throw "Bad format in configuration file";
        }
        if (error)
        {
            cerr << filename << ":" << lineNumber << ": " << error << ": \"" << line << "\"" << endl;
            throw "Bad value in configuration file";
        }
    }
}


// Node stream operations ----------------------------------------------------

strata::Node *
strata::Node::mustLoad (const string & filename)
{
    unique_ptr<Node> result (newRoot ());
    try
    {
        result->mergeFile (filename);
    }
    catch (const char *)
    {
        cerr << "Could not load configuration from " << filename << endl;
        throw;
    }
    return result.release ();
}

void
strata::Node::mergeFile (const string & filename)
{
    FormatText format;
    format.readFile (*this, filename);
}

void
strata::Node::mergeReader (istream & reader, bool stopOnErrors)
{
    FormatText format (stopOnErrors);
    format.read (*this, reader);
}
