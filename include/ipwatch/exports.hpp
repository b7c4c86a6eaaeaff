////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2021-2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2021.06.21 Initial version.
//      2026.10.19 IPWATCH__ prefix.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef IPWATCH__STATIC
#   ifndef IPWATCH__EXPORT
#       if _MSC_VER
#           if defined(IPWATCH__EXPORTS)
#               define IPWATCH__EXPORT __declspec(dllexport)
#           else
#               define IPWATCH__EXPORT __declspec(dllimport)
#           endif
#       else
#           define IPWATCH__EXPORT
#       endif
#   endif
#else
#   define IPWATCH__EXPORT
#endif // !IPWATCH__STATIC
