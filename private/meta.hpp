#pragma once

#include "filter.hpp"

#include <glaze/glaze.hpp>

template <>
struct glz::meta<switcher::pattern_set>
{
    using T                     = switcher::pattern_set;
    static constexpr auto value = object("include_names", &T::include_names,               //
                                         "include_descriptions", &T::include_descriptions, //
                                         "exclude_names", &T::exclude_names,               //
                                         "exclude_descriptions", &T::exclude_descriptions);
};
