#pragma once

namespace page_layout {

// Shared grid constants for the hierarchy builder and the target converters.
// Widths are percentages of the enclosing row.

namespace layout {

constexpr double full_width = 100.0;
// Column sizes may overshoot the row by this much before the row is rejected.
constexpr double column_sum_tolerance = 1.0;
// Bootstrap-style col-N classes divide the row into twelfths.
constexpr int grid_columns = 12;
constexpr int size_decimals = 2;
// Upper bound on the tracks one repeat() contributes.
constexpr int max_grid_tracks = 24;

} // namespace layout

} // namespace page_layout
