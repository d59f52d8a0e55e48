#pragma once

/**
 * SPNLearn Inference
 *
 * Bottom-up log-likelihood evaluation. Rows are indexed by variable id;
 * a NaN value marginalizes its variable out (leaf log-likelihood 0).
 */

#include "types.hpp"
#include "dataset.hpp"
#include "node.hpp"
#include <vector>

namespace spnlearn {

Double log_likelihood(const Node& root, const Float* row);

// One value per dataset row
std::vector<Double> log_likelihood(const Node& root, const Dataset& data);

} // namespace spnlearn
