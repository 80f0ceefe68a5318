#pragma once

#include <string_view>

namespace vidyeet
{

    constexpr std::string_view version() noexcept
    {
        return "0.4.0";
    }

} // namespace vidyeet
