////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2021.06.21 Initial version.
//      2025.03.11 Refactored.
//      2026.10.19 Address tracking error codes.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include "exports.hpp"
#include "pfs/error.hpp"
#include <string>
#include <system_error>

IPWATCH__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , resolution_error  // Network interface not found, ambiguous or no default route
    , detection_error   // Current address can not be determined
    , lifecycle_error   // Tracker or monitor start/stop failure
};

class error_category : public std::error_category
{
public:
    IPWATCH__EXPORT char const * name () const noexcept override;
    IPWATCH__EXPORT std::string message (int ev) const override;
};

inline std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

IPWATCH__NAMESPACE_END
