/// @file src/core/errors.cpp

#include "drawstat/errors.hpp"

#include <fmt/format.h>

namespace drawstat {

InsufficientDataError::InsufficientDataError(std::size_t have, std::size_t need)
    : Error(fmt::format("insufficient data: have {} draws, need at least {}", have, need))
    , have_(have)
    , need_(need)
{}

}  // namespace drawstat
