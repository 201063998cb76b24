/*
The value carried by a configuration node, along with the textual grammar
used to coerce strings into typed values.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_value_h
#define strata_value_h

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <ostream>
#include <memory>

#include "shared.h"


namespace strata
{
    typedef std::chrono::nanoseconds                Duration;
    typedef std::chrono::system_clock::time_point   Time;

    /**
        A closed set of value types. A node that was never assigned carries NONE.
        A LIST holds scalar items, normally all of the same type.

        <p>Conversion between types follows a fixed order: a value that already has
        the requested type is returned directly. Otherwise its string form is parsed
        with the grammar of the requested type. All to*() functions return false
        rather than throwing when the value can't be converted.
    **/
    class SHARED Value
    {
    public:
        enum Type {NONE, STRING, INT, FLOAT, BOOL, DURATION, TIME, LIST};

        // Messages returned by conversions that fail. These are static, so callers may hold the pointer indefinitely.
        static const char * const badValue;
        static const char * const badDuration;
        static const char * const badTime;

        Value ();
        Value (const char *        value);  ///< nullptr produces NONE
        Value (const std::string & value);
        Value (int                 value);
        Value (long                value);
        Value (long long           value);
        Value (double              value);
        Value (bool                value);
        Value (Duration            value);
        Value (Time                value);
        Value (const std::vector<Value> & items);

        Type type () const;
        bool empty () const;  ///< True if this value is NONE.
        /**
            @return The items of a LIST, or an empty vector for any other type.
            The reference is only valid while this Value exists. Hold the Value in a
            local, rather than calling this on a temporary such as the result of Node::get().
        **/
        const std::vector<Value> & items () const;

        std::string toString   () const;
        bool        toInt      (int64_t & result) const;
        bool        toFloat    (double & result) const;
        bool        toBool     (bool & result) const;
        bool        toDuration (Duration & result) const;
        bool        toTime     (Time & result) const;

        bool operator== (const Value & that) const;
        bool operator!= (const Value & that) const;

        // Textual grammar
        /// Accepts 1, t, true, on and 0, f, false, off, in any letter case.
        static bool parseBool     (const std::string & text, bool & result);
        /// Strict base-10 integer with optional sign. Must fit in 64 bits.
        static bool parseInt      (const std::string & text, int64_t & result);
        static bool parseFloat    (const std::string & text, double & result);
        /**
            Accepts "[<days>d][<hours>h][<minutes>m][<seconds>s]", where each unit may be
            spelled out (days, hours, min, mins, minute, minutes, second, seconds) and
            whitespace may separate the parts. At least one part must be present.
            Also accepts "HH:MM" and "HH:MM:SS".
        **/
        static bool parseDuration (const std::string & text, Duration & result);
        /**
            Tries a fixed list of layouts: RFC3339 (with or without fraction), ANSIC,
            UnixDate, RubyDate, RFC822, RFC822Z, RFC850, RFC1123, RFC1123Z,
            "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DD". The result is in UTC and truncated
            to whole seconds.
        **/
        static bool parseTime     (const std::string & text, Time & result);

        /**
            Interprets text according to a type name as used in configuration files:
            "" or "string", "int", "float", "bool", "duration", "date" or "time".
            A "[]" prefix denotes a comma-separated list. A backslash before a comma
            keeps the comma in the item.
            @return nullptr on success, or a static message describing the failure.
        **/
        static const char * parse (const std::string & type, const std::string & text, Value & result);

        static std::string formatFloat    (double value);
        static std::string formatDuration (Duration value);
        static std::string formatTime     (Time value);

    protected:
        Type               kind;
        std::string        text;     ///< STRING payload
        union
        {
            int64_t        integer;  ///< INT payload, and DURATION in nanoseconds
            double         real;
            bool           flag;
        };
        Time               moment;
        std::shared_ptr<const std::vector<Value>> list;  ///< LIST payload. Held by pointer because Value is incomplete here.
    };

    SHARED std::ostream & operator<< (std::ostream & out, const Value & value);
}

#endif
