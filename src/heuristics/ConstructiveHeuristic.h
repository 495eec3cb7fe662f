#pragma once
#include "Instance.h"

enum heuristic_type {
    NEH,
    PALMER,
    CDS,
    JOHNSON,
    SPT,
    LPT,
    PENDULUM,
    RANDOM,
    HEURISTIC_COUNT
};

// Builds an initial sequence from the processing times alone.
class ConstructiveHeuristic
{
public:
    virtual ~ConstructiveHeuristic() = default;

    virtual heuristic_type getType() const = 0;
    virtual string getName() const = 0;

    // always returns a permutation of all jobs of the instance
    virtual Sequence build(const Instance& instance) const = 0;
};

// seed is only used by the randomized heuristics
std::unique_ptr<ConstructiveHeuristic> createHeuristic(heuristic_type type, unsigned int seed = 0);

// case-insensitive, throws ConfigurationError for unknown names
heuristic_type parseHeuristicName(const string& name);
string heuristicName(heuristic_type type);
