/// @file fwd.hpp
/// @brief Forward declarations for yardmap_location module

#pragma once

namespace yardmap_location {

struct LocationCode;
struct LocationFormat;
struct RowTierLimit;

} // namespace yardmap_location
