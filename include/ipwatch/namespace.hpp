////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2024-2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2024.12.26 Initial version.
//      2026.10.19 Renamed namespace to `ipwatch`.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef IPWATCH__NAMESPACE_NAME
#   define IPWATCH__NAMESPACE_NAME ipwatch
#   define IPWATCH__NAMESPACE_BEGIN namespace IPWATCH__NAMESPACE_NAME {
#   define IPWATCH__NAMESPACE_END }
#endif
