#pragma once

#include "detection.hpp"
#include "raw_result.hpp"

#include <string>
#include <vector>

namespace objdet {

class ResultTranslator {
public:
    // Maps raw detector output onto Detection entities, preserving order.
    // Coordinates are truncated toward zero, never rounded: an edge at 10.7 lands in pixel 10.
    // Throws UnknownClassError for an index outside label_table and ContractError for
    // scores outside [0, 1], mismatched arrays or degenerate boxes.
    static std::vector<Detection> translate(const RawResult& raw,
                                            const std::vector<std::string>& label_table);
};

} // namespace objdet
