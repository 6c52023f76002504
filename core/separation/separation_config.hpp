#pragma once

#include <string>

namespace pagoracle {

/// Decision procedure used by SeparationOracle. Both give the same
/// answer on acyclic directed mixed graphs.
enum class SeparationStrategy {
    AncestralMoralization,  // augmented-graph separation, polynomial
    LegalPath               // simple-path enumeration, exponential worst case
};

inline std::string toString(SeparationStrategy strategy) {
    switch (strategy) {
        case SeparationStrategy::AncestralMoralization: return "ancestral-moralization";
        case SeparationStrategy::LegalPath:             return "legal-path";
    }
    return "unknown";
}

/// Configuration for m-separation queries.
struct SeparationConfig {
    SeparationStrategy strategy = SeparationStrategy::AncestralMoralization;
};

} // namespace pagoracle
