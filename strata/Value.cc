/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#include "Value.h"
#include "strings.h"

#include <regex>
#include <algorithm>
#include <cmath>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <limits>
#include <memory>

using namespace std;


const char * const strata::Value::badValue    = "bad value";
const char * const strata::Value::badDuration = "bad duration";
const char * const strata::Value::badTime     = "bad time format";

// Duration grammar
static const regex durationUnits ("^(?:\\s*(\\d+)\\s*d(?:ays?)?)?(?:\\s*(\\d+)\\s*h(?:ours?)?)?(?:\\s*(\\d+)\\s*m(?:in(?:ute)?s?)?)?(?:\\s*(\\d+)\\s*s(?:econds?)?)?$");
static const regex durationHMS   ("^([0-9]{2,10}):([0-9]{2})(?::([0-9]{2}))?$");

// Time grammar
static const regex rfc3339 ("^([0-9]{4})-([0-9]{2})-([0-9]{2})T([0-9]{2}):([0-9]{2}):([0-9]{2})(\\.[0-9]+)?(Z|[+-][0-9]{2}:[0-9]{2})$");

/**
    Layouts tried after RFC3339, in order. Numeric-zone variants come before their
    named-zone twins, since %Z skips over any token without converting it.
**/
static const char * const timeLayouts[] =
{
    "%a %b %e %H:%M:%S %Y",         // ANSIC
    "%a %b %d %H:%M:%S %z %Y",      // RubyDate
    "%a %b %e %H:%M:%S %Z %Y",      // UnixDate
    "%d %b %y %H:%M %z",            // RFC822Z
    "%d %b %y %H:%M %Z",            // RFC822
    "%A, %d-%b-%y %H:%M:%S %Z",     // RFC850
    "%a, %d %b %Y %H:%M:%S %z",     // RFC1123Z
    "%a, %d %b %Y %H:%M:%S %Z",     // RFC1123
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%d",
    nullptr
};


// class Value ---------------------------------------------------------------

strata::Value::Value ()
:   kind (NONE),
    integer (0)
{
}

strata::Value::Value (const char * value)
:   kind (value ? STRING : NONE),
    integer (0)
{
    if (value) text = value;
}

strata::Value::Value (const string & value)
:   kind (STRING),
    text (value),
    integer (0)
{
}

strata::Value::Value (int value)
:   kind (INT),
    integer (value)
{
}

strata::Value::Value (long value)
:   kind (INT),
    integer (value)
{
}

strata::Value::Value (long long value)
:   kind (INT),
    integer (value)
{
}

strata::Value::Value (double value)
:   kind (FLOAT)
{
    real = value;
}

strata::Value::Value (bool value)
:   kind (BOOL)
{
    integer = 0;
    flag    = value;
}

strata::Value::Value (Duration value)
:   kind (DURATION),
    integer (value.count ())
{
}

strata::Value::Value (Time value)
:   kind (TIME),
    integer (0),
    moment (value)
{
}

strata::Value::Value (const vector<Value> & items)
:   kind (LIST),
    integer (0),
    list (make_shared<const vector<Value>> (items))
{
}

strata::Value::Type
strata::Value::type () const
{
    return kind;
}

bool
strata::Value::empty () const
{
    return kind == NONE;
}

const vector<strata::Value> &
strata::Value::items () const
{
    static const vector<Value> nothing;
    if (list) return *list;
    return nothing;
}

string
strata::Value::toString () const
{
    switch (kind)
    {
        case STRING:   return text;
        case INT:      return to_string (integer);
        case FLOAT:    return formatFloat (real);
        case BOOL:     return flag ? "true" : "false";
        case DURATION: return formatDuration (Duration (integer));
        case TIME:     return formatTime (moment);
        case LIST:
        {
            string result = "[";
            for (size_t i = 0; i < list->size (); i++)
            {
                if (i) result += " ";
                result += (*list)[i].toString ();
            }
            return result + "]";
        }
        default:       return "";
    }
}

bool
strata::Value::toInt (int64_t & result) const
{
    if (kind == INT)
    {
        result = integer;
        return true;
    }
    return parseInt (toString (), result);
}

bool
strata::Value::toFloat (double & result) const
{
    if (kind == FLOAT)
    {
        result = real;
        return true;
    }
    return parseFloat (toString (), result);
}

bool
strata::Value::toBool (bool & result) const
{
    if (kind == BOOL)
    {
        result = flag;
        return true;
    }
    return parseBool (toString (), result);
}

bool
strata::Value::toDuration (Duration & result) const
{
    if (kind == DURATION)
    {
        result = Duration (integer);
        return true;
    }
    return parseDuration (toString (), result);
}

bool
strata::Value::toTime (Time & result) const
{
    if (kind == TIME)
    {
        result = moment;
        return true;
    }
    return parseTime (toString (), result);
}

bool
strata::Value::operator== (const Value & that) const
{
    if (kind != that.kind) return false;
    switch (kind)
    {
        case NONE:     return true;
        case STRING:   return text    == that.text;
        case FLOAT:    return real    == that.real;
        case BOOL:     return flag    == that.flag;
        case TIME:     return moment  == that.moment;
        case LIST:     return *list   == *that.list;
        default:       return integer == that.integer;  // INT and DURATION
    }
}

bool
strata::Value::operator!= (const Value & that) const
{
    return ! (*this == that);
}

bool
strata::Value::parseBool (const string & text, bool & result)
{
    string lower = toLowerCase (text);
    if (lower == "1"  ||  lower == "t"  ||  lower == "true"   ||  lower == "on")
    {
        result = true;
        return true;
    }
    if (lower == "0"  ||  lower == "f"  ||  lower == "false"  ||  lower == "off")
    {
        result = false;
        return true;
    }
    return false;
}

bool
strata::Value::parseInt (const string & text, int64_t & result)
{
    if (text.empty ()) return false;
    const char * start = text.c_str ();
    const char * digits = start;
    if (*digits == '+'  ||  *digits == '-') digits++;
    if (! isdigit ((unsigned char) *digits)) return false;  // rejects leading whitespace, which strtoll would skip

    char * end;
    errno = 0;
    long long value = strtoll (start, &end, 10);
    if (errno == ERANGE  ||  *end) return false;
    result = value;
    return true;
}

bool
strata::Value::parseFloat (const string & text, double & result)
{
    if (text.empty ()  ||  isspace ((unsigned char) text[0])) return false;
    const char * start = text.c_str ();
    char * end;
    errno = 0;
    double value = strtod (start, &end);
    if (*end  ||  end == start) return false;
    if (errno == ERANGE  &&  std::isinf (value)) return false;
    result = value;
    return true;
}

/// Adds count * unit to total, which is in seconds. Fails when the sum no longer fits a Duration.
static bool
addSeconds (int64_t & total, int64_t count, int64_t unit)
{
    static const int64_t limit = numeric_limits<int64_t>::max () / 1000000000;
    if (count < 0  ||  count > (limit - total) / unit) return false;
    total += count * unit;
    return true;
}

bool
strata::Value::parseDuration (const string & text, Duration & result)
{
    if (text.empty ()) return false;

    smatch matches;
    if (regex_match (text, matches, durationHMS))
    {
        int64_t hours   = strtoll (matches.str (1).c_str (), nullptr, 10);
        int64_t minutes = strtoll (matches.str (2).c_str (), nullptr, 10);
        int64_t seconds = matches[3].matched ? strtoll (matches.str (3).c_str (), nullptr, 10) : 0;
        int64_t total = 0;
        if (! addSeconds (total, hours, 3600)  ||  ! addSeconds (total, minutes, 60)  ||  ! addSeconds (total, seconds, 1)) return false;
        result = chrono::seconds (total);
        return true;
    }

    if (! regex_match (text, matches, durationUnits)) return false;
    static const int64_t unit[4] = {86400, 3600, 60, 1};
    int64_t total = 0;
    for (int i = 0; i < 4; i++)
    {
        if (! matches[i+1].matched) continue;
        int64_t part;
        if (! parseInt (matches.str (i+1), part)  ||  ! addSeconds (total, part, unit[i])) return false;
    }
    result = chrono::seconds (total);
    return true;
}

bool
strata::Value::parseTime (const string & text, Time & result)
{
    struct tm parts;
    long      offset = 0;  // seconds east of UTC

    smatch matches;
    if (regex_match (text, matches, rfc3339))
    {
        memset (&parts, 0, sizeof (parts));
        parts.tm_year = atoi (matches.str (1).c_str ()) - 1900;
        parts.tm_mon  = atoi (matches.str (2).c_str ()) - 1;
        parts.tm_mday = atoi (matches.str (3).c_str ());
        parts.tm_hour = atoi (matches.str (4).c_str ());
        parts.tm_min  = atoi (matches.str (5).c_str ());
        parts.tm_sec  = atoi (matches.str (6).c_str ());
        if (parts.tm_mon > 11  ||  parts.tm_mday < 1  ||  parts.tm_mday > 31  ||  parts.tm_hour > 23  ||  parts.tm_min > 59  ||  parts.tm_sec > 60) return false;
        string zone = matches.str (8);
        if (zone != "Z")
        {
            long hours   = atoi (zone.substr (1, 2).c_str ());
            long minutes = atoi (zone.substr (4, 2).c_str ());
            offset = hours * 3600 + minutes * 60;
            if (zone[0] == '-') offset = -offset;
        }
    }
    else
    {
        bool found = false;
        for (int i = 0; timeLayouts[i]; i++)
        {
            memset (&parts, 0, sizeof (parts));
            const char * end = strptime (text.c_str (), timeLayouts[i], &parts);
            if (! end  ||  *end) continue;
            offset = parts.tm_gmtoff;
            found = true;
            break;
        }
        if (! found) return false;
    }

    parts.tm_isdst = 0;
    time_t seconds = timegm (&parts) - offset;
    result = Time (chrono::duration_cast<Time::duration> (chrono::seconds (seconds)));
    return true;
}

const char *
strata::Value::parse (const string & type, const string & text, Value & result)
{
    string itemType = type;
    bool   isList   = type.compare (0, 2, "[]") == 0;
    if (isList) itemType = type.substr (2);

    vector<string> pieces;
    if (isList) pieces = splitEscaped (text, ",", "\\");
    else        pieces.push_back (text);

    vector<Value> values;
    values.reserve (pieces.size ());
    for (auto & piece : pieces)
    {
        if (itemType.empty ()  ||  itemType == "string")
        {
            values.push_back (Value (piece));
        }
        else if (itemType == "int")
        {
            int64_t v;
            if (! parseInt (piece, v)) return badValue;
            values.push_back (Value (v));
        }
        else if (itemType == "float")
        {
            double v;
            if (! parseFloat (piece, v)) return badValue;
            values.push_back (Value (v));
        }
        else if (itemType == "bool")
        {
            bool v;
            if (! parseBool (piece, v)) return badValue;
            values.push_back (Value (v));
        }
        else if (itemType == "duration")
        {
            Duration v;
            if (! parseDuration (piece, v)) return badDuration;
            values.push_back (Value (v));
        }
        else if (itemType == "time"  ||  itemType == "date")
        {
            Time v;
            if (! parseTime (piece, v)) return badTime;
            values.push_back (Value (v));
        }
        else
        {
            return "bad type";
        }
    }

    if (isList) result = Value (values);
    else        result = values[0];
    return nullptr;
}

string
strata::Value::formatFloat (double value)
{
    if (std::isnan (value)) return "NaN";
    if (std::isinf (value)) return value > 0 ? "+Inf" : "-Inf";
    if (value == 0) return signbit (value) ? "-0" : "0";

    // Find the shortest digit string that reads back as the same value.
    char buffer[32];
    for (int precision = 1; precision <= 17; precision++)
    {
        snprintf (buffer, sizeof (buffer), "%.*e", precision - 1, value);
        if (strtod (buffer, nullptr) == value) break;
    }

    // Split "-d.ddde+XX" into sign, digits and exponent.
    string scientific = buffer;
    string sign;
    if (scientific[0] == '-')
    {
        sign = "-";
        scientific = scientific.substr (1);
    }
    size_t e = scientific.find ('e');
    int exponent = atoi (scientific.c_str () + e + 1);
    string digits = scientific.substr (0, e);
    digits.erase (std::remove (digits.begin (), digits.end (), '.'), digits.end ());

    string result;
    if (exponent < -4  ||  exponent >= 21)
    {
        result = digits.substr (0, 1);
        if (digits.size () > 1) result += "." + digits.substr (1);
        char tail[8];
        snprintf (tail, sizeof (tail), "e%c%02d", exponent < 0 ? '-' : '+', abs (exponent));
        result += tail;
    }
    else if (exponent < 0)
    {
        result = "0." + string (-exponent - 1, '0') + digits;
    }
    else if ((size_t) exponent + 1 >= digits.size ())
    {
        result = digits + string (exponent + 1 - digits.size (), '0');
    }
    else
    {
        result = digits.substr (0, exponent + 1) + "." + digits.substr (exponent + 1);
    }
    return sign + result;
}

/**
    Writes whole units followed by a fraction of "scale" digits, with trailing zeros removed.
**/
static string
formatFraction (uint64_t value, uint64_t unit, int scale)
{
    string result = to_string (value / unit);
    uint64_t remainder = value % unit;
    if (remainder)
    {
        string fraction = to_string (remainder);
        fraction = string (scale - fraction.size (), '0') + fraction;
        while (fraction.back () == '0') fraction.pop_back ();
        result += "." + fraction;
    }
    return result;
}

string
strata::Value::formatDuration (Duration value)
{
    int64_t  count    = value.count ();
    bool     negative = count < 0;
    uint64_t u        = negative ? (uint64_t) 0 - (uint64_t) count : (uint64_t) count;

    string result;
    if (u == 0)
    {
        return "0s";
    }
    else if (u < 1000)
    {
        result = to_string (u) + "ns";
    }
    else if (u < 1000000)
    {
        result = formatFraction (u, 1000, 3) + "µs";
    }
    else if (u < 1000000000)
    {
        result = formatFraction (u, 1000000, 6) + "ms";
    }
    else
    {
        uint64_t seconds = u / 1000000000;
        uint64_t hours   = seconds / 3600;
        uint64_t minutes = seconds / 60 % 60;
        if (hours) result = to_string (hours) + "h";
        if (hours  ||  minutes) result += to_string (minutes) + "m";
        result += formatFraction (u % 60000000000ull, 1000000000, 9) + "s";
    }
    if (negative) result = "-" + result;
    return result;
}

string
strata::Value::formatTime (Time value)
{
    int64_t nanos   = chrono::duration_cast<chrono::nanoseconds> (value.time_since_epoch ()).count ();
    int64_t seconds = nanos / 1000000000;
    int64_t fraction = nanos % 1000000000;
    if (fraction < 0)
    {
        fraction += 1000000000;
        seconds--;
    }

    time_t t = seconds;
    struct tm parts;
    gmtime_r (&t, &parts);
    char buffer[64];
    strftime (buffer, sizeof (buffer), "%Y-%m-%dT%H:%M:%S", &parts);
    string result = buffer;
    if (fraction)
    {
        string digits = to_string (fraction);
        digits = string (9 - digits.size (), '0') + digits;
        while (digits.back () == '0') digits.pop_back ();
        result += "." + digits;
    }
    return result + "Z";
}

ostream &
strata::operator<< (ostream & out, const Value & value)
{
    return out << value.toString ();
}
