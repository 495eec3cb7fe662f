#pragma once
#include "common.h"

// acceptance rule of one local search scan
enum local_search_policy {
    BEST_IMPROVEMENT,
    FIRST_IMPROVEMENT
};

struct FlowShopOptions {
    // params for 2-opt and insertion
    int max_iterations = 1000;
    local_search_policy policy = BEST_IMPROVEMENT;

    // params for vns
    int vns_max_iterations = 100;
    int vns_perturbation_size = 2;

    // params for the genetic algorithm
    int ga_population_size = 50;
    double ga_mutation_rate = 0.1;
    double ga_crossover_rate = 0.8;
    int ga_elite_size = 5;
    int ga_generations = -1;  // -1: 50 when seeded, 100 when standalone
    int ga_tournament_size = 3;

    // experiment settings
    int seed = 0;             // negative: seed from the clock
    double time_limit = 7200; // seconds, per search stage
    int screen = 0;

    int getGenerations(bool seeded) const;
    unsigned int getSeed() const;

    // throws ConfigurationError on the first out-of-range value
    void validate() const;
};

local_search_policy parsePolicy(const string& name);
string policyName(local_search_policy policy);
