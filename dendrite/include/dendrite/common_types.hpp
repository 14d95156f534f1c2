#pragma once

/*
 * Common definitions for index and value types used across the library.
 */

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace dend {

// Real values of the discretised system: voltages, conductances, currents.

using fvm_value_type = double;

// Indices into per-compartment, per-branch or per-instance arrays.
// Signed, so that -1 can mark "no parent" and empty child slots.

using fvm_index_type = std::int32_t;

// Counts of compartments, branches, cells and mechanism instances.

using fvm_size_type = std::make_unsigned_t<fvm_index_type>;

// Sentinel for a missing parent or an unused child slot.

constexpr fvm_index_type fvm_npos = -1;

} // namespace dend
