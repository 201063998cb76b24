/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "FormatJSON.h"

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <iterator>

using namespace std;


typedef rapidjson::Writer<rapidjson::StringBuffer> JSONWriter;

static void
writeValue (const strata::Value & value, JSONWriter & writer)
{
    switch (value.type ())
    {
        case strata::Value::STRING:
        {
            string text = value.toString ();
            writer.String (text.c_str (), text.size ());
            break;
        }
        case strata::Value::INT:
        {
            int64_t result = 0;
            value.toInt (result);
            writer.Int64 (result);
            break;
        }
        case strata::Value::DURATION:
        {
            strata::Duration result = strata::Duration::zero ();
            value.toDuration (result);
            writer.Int64 (result.count ());
            break;
        }
        case strata::Value::FLOAT:
        {
            double result = 0;
            value.toFloat (result);
            writer.Double (result);
            break;
        }
        case strata::Value::BOOL:
        {
            bool result = false;
            value.toBool (result);
            writer.Bool (result);
            break;
        }
        case strata::Value::TIME:
        {
            string text = value.toString ();
            writer.String (text.c_str (), text.size ());
            break;
        }
        case strata::Value::LIST:
            writer.StartArray ();
            for (auto & item : value.items ()) writeValue (item, writer);
            writer.EndArray ();
            break;
        default:
            writer.Null ();
    }
}

static bool
numericKeys (const strata::Node & node)
{
    int64_t ignore;
    for (auto & k : node.childKeys ()) if (! strata::Value::parseInt (k, ignore)) return false;
    return true;
}

static void
writeNode (const strata::Node & node, JSONWriter & writer)
{
    bool forceArray = node.flags & strata::Node::ForceArray;
    bool forceMap   = node.flags & strata::Node::ForceMap;
    if (node.isLeaf ()  &&  ! forceArray  &&  ! forceMap)
    {
        writeValue (node.value (), writer);
        return;
    }

    if (forceArray  ||  (! forceMap  &&  numericKeys (node)))
    {
        writer.StartArray ();
        for (auto & c : node) writeNode (c, writer);
        writer.EndArray ();
        return;
    }

    writer.StartObject ();
    for (auto & c : node)
    {
        writer.Key (c.key ().c_str (), c.key ().size ());
        writeNode (c, writer);
    }
    writer.EndObject ();
}

static void
readValue (strata::Node & node, vector<strata::Key> & path, const rapidjson::Value & json)
{
    if (json.IsObject ())
    {
        for (auto m = json.MemberBegin (); m != json.MemberEnd (); ++m)
        {
            path.push_back (string (m->name.GetString (), m->name.GetStringLength ()));
            readValue (node, path, m->value);
            path.pop_back ();
        }
    }
    else if (json.IsArray ())
    {
        int index = 1;
        for (auto e = json.Begin (); e != json.End (); ++e)
        {
            path.push_back (index++);
            readValue (node, path, *e);
            path.pop_back ();
        }
    }
    else if (json.IsString ())  node.set (string (json.GetString (), json.GetStringLength ()), path);
    else if (json.IsBool ())    node.set (json.GetBool (), path);
    else if (json.IsInt64 ())   node.set ((long long) json.GetInt64 (), path);
    else if (json.IsNumber ())  node.set (json.GetDouble (), path);
    else                        node.addNode (path);  // null
}


// class FormatJSON ----------------------------------------------------------

void
strata::FormatJSON::read (Node & node, istream & reader)
{
    string text ((istreambuf_iterator<char> (reader)), istreambuf_iterator<char> ());

    rapidjson::Document document;
    document.Parse (text.c_str (), text.size ());
    if (document.HasParseError ())
    {
        cerr << "JSON parse error at offset " << document.GetErrorOffset () << ": " << rapidjson::GetParseError_En (document.GetParseError ()) << endl;
        throw "Failed to parse JSON";
    }
    if (! document.IsObject ())
    {
        cerr << "JSON document must be an object" << endl;
        throw "Failed to parse JSON";
    }

    vector<Key> path;
    readValue (node, path, document);
}

void
strata::FormatJSON::write (const Node & node, ostream & writer)
{
    writer << toString (node);
}

string
strata::FormatJSON::toString (const Node & node)
{
    rapidjson::StringBuffer buffer;
    JSONWriter writer (buffer);
    writeNode (node, writer);
    return string (buffer.GetString (), buffer.GetSize ());
}
