/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


#ifndef strata_reply_h
#define strata_reply_h

#include <map>
#include <string>
#include <vector>

#include "shared.h"


namespace strata
{
    /**
        Result of a settings query: each key carries one or more string values.
        Keys are kept in sorted order.
    **/
    class SHARED Reply : public std::map<std::string, std::vector<std::string>>
    {
    public:
        void set (const std::string & key, const std::vector<std::string> & values);
        void add (const std::string & key, const std::vector<std::string> & values);
        void add (const std::string & key, const std::string & value);

        /// @return The first value stored under key, or "" if there is none.
        std::string get     (const std::string & key) const;
        int         getInt  (const std::string & key) const;  ///< 0 if the first value is not an integer
        bool        getBool (const std::string & key) const;  ///< true only for 1, t, true or on

        /**
            Collects every value that starts with "ERROR_", under the same keys.
        **/
        Reply errors () const;

        /**
            @return "" if the status key holds TRANS_OK. Otherwise the first error value found,
            or "TRANS_ERROR" if there is none.
        **/
        std::string errorReason () const;
    };
}

#endif
