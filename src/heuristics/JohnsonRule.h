#pragma once
#include "ConstructiveHeuristic.h"

/**
 * Johnson's rule for two machines. Jobs with times1 <= times2 go first in
 * ascending order of times1, the others follow in descending order of
 * times2. Both groups are stable. Optimal for the 2-machine flow shop.
 */
Sequence johnsonsRule(const vector<double>& times1, const vector<double>& times2);

// throws DimensionError unless the instance has exactly 2 machines
class JohnsonHeuristic : public ConstructiveHeuristic
{
public:
    heuristic_type getType() const override { return JOHNSON; }
    string getName() const override { return "Johnson"; }
    Sequence build(const Instance& instance) const override;
};

/**
 * Campbell, Dudek and Smith: for every split k in 1..m-1 machines [0, k)
 * form virtual machine 1 and [k, m) virtual machine 2, Johnson's rule orders
 * the jobs, and the split with the lowest real makespan wins (first on ties).
 */
class CDSHeuristic : public ConstructiveHeuristic
{
public:
    heuristic_type getType() const override { return CDS; }
    string getName() const override { return "CDS"; }
    Sequence build(const Instance& instance) const override;

    // Johnson sequence of the split at machine k, 1 <= k < m
    static Sequence buildForSplit(const Instance& instance, int k);
};
