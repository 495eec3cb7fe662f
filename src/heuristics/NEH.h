#pragma once
#include "ConstructiveHeuristic.h"

/**
 * Nawaz, Enscore and Ham. Jobs are taken in descending order of total
 * processing time and each one is inserted at the position of the partial
 * sequence that gives the smallest makespan (earliest position on ties).
 */
class NEHHeuristic : public ConstructiveHeuristic
{
public:
    heuristic_type getType() const override { return NEH; }
    string getName() const override { return "NEH"; }
    Sequence build(const Instance& instance) const override;

    // best insertion position of job into partial, lowest index on ties
    static int bestInsertionPosition(const Sequence& partial, int job, const Instance& instance,
                                     double& best_makespan);
};
