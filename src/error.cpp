////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2023.01.01 Initial version
//      2026.10.19 Address tracking error codes.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/error.hpp"
#include "pfs/i18n.hpp"

IPWATCH__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "ipwatch::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::resolution_error:
            return tr::_("network interface resolution error");
        case errc::detection_error:
            return tr::_("address detection error");
        case errc::lifecycle_error:
            return tr::_("tracker lifecycle error");

        default: return tr::_("unknown ipwatch error");
    }
}

IPWATCH__NAMESPACE_END
