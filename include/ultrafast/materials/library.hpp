#pragma once

#include "ultrafast/materials/dispersive.hpp"

namespace ultrafast {
namespace materials {

/// Air, Ciddor 1996 (formula 6, 0.23 - 1.69 um).
const DispersiveMaterial &air();

/// Fused silica, Malitson 1965 (formula 1, 0.21 - 6.7 um).
const DispersiveMaterial &fused_silica();

/// SCHOTT N-BK7 (formula 2, 0.3 - 2.5 um).
const DispersiveMaterial &bk7();

} // namespace materials
} // namespace ultrafast
