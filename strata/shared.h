/*
Copyright 2026 National Technology & Engineering Solutions of Sandia, LLC (NTESS).
Under the terms of Contract DE-NA0003525 with NTESS,
the U.S. Government retains certain rights in this software.
*/


// Unconditional include, so that we always replace the current definition of SHARED.
// This should be the last include in the header, to ensure nothing else undoes
// the setting of SHARED or is impacted by it.
#undef SHARED
#ifdef _MSC_VER
#  ifdef strata_EXPORTS
#    define SHARED __declspec(dllexport)
#  elif defined strata_DLL
#    define SHARED __declspec(dllimport)
#  else
#    define SHARED
#  endif
#else
#  define SHARED
#endif
