#pragma once

#include <vector>

#include "core/types.hpp"

namespace camio {

struct CorrespondenceMatch {
    CorrespondenceSet set;
    bool any_valid{false};
};

// Aligns observations with the layout's fixed marker order. Unknown ids are
// ignored; a repeated id overwrites the earlier observation.
CorrespondenceMatch matchCorrespondences(
    const std::vector<MarkerObservation>& observations,
    const MarkerLayout& layout);

}  // namespace camio
