#pragma once
#include "ml/ProcessClassifier.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procsight::ml {

// per_label examples drawn around a resource profile for each workload label
std::vector<LabeledSample> synthetic_examples(size_t per_label, uint64_t seed);

// Label guessed from the process name, if it matches a known server or runtime.
std::optional<std::string> label_from_name(const procsight::model::Sample& s);

} // namespace procsight::ml
