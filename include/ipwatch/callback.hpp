////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2025-2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2025.05.06 Initial version.
//      2026.10.19 Added `address_callback_t`.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <functional>
#include <string>

IPWATCH__NAMESPACE_BEGIN

template <typename T>
using callback_t = std::function<T>;

// Consumer of address change notifications. Empty callback means
// no consumer attached.
using address_callback_t = callback_t<void (std::string const &)>;

IPWATCH__NAMESPACE_END
