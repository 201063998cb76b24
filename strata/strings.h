/*
String utilities shared by the key parser, the loader and the settings engine.

Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_strings_h
#define strata_strings_h

#include <string>
#include <vector>
#include <cctype>

namespace strata
{
    inline void split (const std::string & source, const std::string & delimiter, std::string & first, std::string & second)
    {
        size_t index = source.find (delimiter);
        if (index == std::string::npos)
        {
            first = source;
            second.clear ();
        }
        else
        {
            std::string temp = source;  // Make a copy of source, in case source is also one of the destination strings.
            first = temp.substr (0, index);
            second = temp.substr (index + delimiter.size ());
        }
    }

    /**
        Breaks source into pieces at every occurrence of delimiter.
        Unlike a tokenizer, empty pieces are retained, so "a..b" produces three
        elements and "" produces one empty element.
    **/
    inline std::vector<std::string> split (const std::string & source, const std::string & delimiter)
    {
        std::vector<std::string> result;
        size_t index = 0;
        while (true)
        {
            size_t next = source.find (delimiter, index);
            if (next == std::string::npos)
            {
                result.push_back (source.substr (index));
                return result;
            }
            result.push_back (source.substr (index, next - index));
            index = next + delimiter.size ();
        }
    }

    inline std::string join (const std::string & delimiter, const std::vector<std::string> & elements)
    {
        size_t count = elements.size ();
        if (count == 0) return "";
        size_t total = (count - 1) * delimiter.size ();
        for (auto & e : elements) total += e.size ();
        std::string result;
        result.reserve (total);
        result = elements[0];
        for (size_t i = 1; i < count; i++)
        {
            result += delimiter;
            result += elements[i];
        }
        return result;
    }

    inline std::string trim (const std::string & source)
    {
        size_t first = 0;
        size_t last  = source.size ();
        while (first < last  &&  isspace ((unsigned char) source[first   ])) first++;
        while (last > first  &&  isspace ((unsigned char) source[last - 1])) last--;
        return source.substr (first, last - first);
    }

    inline std::string toLowerCase (const std::string & source)
    {
        std::string result = source;
        for (auto & c : result) c = tolower ((unsigned char) c);
        return result;
    }

    inline void replaceAll (std::string & target, const std::string & from, const std::string & to)
    {
        if (from.empty ()) return;
        size_t index = 0;
        while ((index = target.find (from, index)) != std::string::npos)
        {
            target.replace (index, from.size (), to);
            index += to.size ();
        }
    }

    /**
        Returns the position of the first occurrence of delimiter in source that
        is not immediately preceded by escape, or npos.
    **/
    inline size_t findUnescaped (const std::string & source, const std::string & delimiter, const std::string & escape, size_t start = 0)
    {
        while (true)
        {
            size_t index = source.find (delimiter, start);
            if (index == std::string::npos) return index;
            if (escape.empty ()  ||  index < start + escape.size ()  ||  source.compare (index - escape.size (), escape.size (), escape) != 0) return index;
            start = index + delimiter.size ();
        }
    }

    /**
        Breaks source at unescaped delimiters into at most n pieces (n < 0 for no limit).
        Within each piece, escape+delimiter is reduced to delimiter.
        The last piece holds the remainder of the string, so "a," gives {"a", ""}.
    **/
    inline std::vector<std::string> splitEscaped (const std::string & source, const std::string & delimiter, const std::string & escape, int n = -1)
    {
        std::vector<std::string> result;
        if (n == 0) return result;
        std::string escaped = escape + delimiter;
        std::string rest = source;
        while ((n < 0  ||  n > 1)  &&  ! rest.empty ())
        {
            size_t index = findUnescaped (rest, delimiter, escape);
            if (index == std::string::npos) break;
            std::string piece = rest.substr (0, index);
            replaceAll (piece, escaped, delimiter);
            result.push_back (piece);
            rest = rest.substr (index + delimiter.size ());
            if (n > 0) n--;
        }
        replaceAll (rest, escaped, delimiter);
        result.push_back (rest);
        return result;
    }
}

#endif
