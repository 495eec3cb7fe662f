#include "defines.h"

#include <chrono>

#include "FlowShopError.h"

int FlowShopOptions::getGenerations(bool seeded) const {
    if (ga_generations >= 0) return ga_generations;
    return seeded ? 50 : 100;
}

unsigned int FlowShopOptions::getSeed() const {
    if (seed < 0)
        return (unsigned int)std::chrono::system_clock::now().time_since_epoch().count();
    return (unsigned int)seed;
}

void FlowShopOptions::validate() const {
    stringstream sout;
    if (max_iterations <= 0)
        sout << "maxIterations must be positive, got " << max_iterations;
    else if (vns_max_iterations <= 0)
        sout << "vnsMaxIterations must be positive, got " << vns_max_iterations;
    else if (vns_perturbation_size < 0)
        sout << "vnsPerturbationSize must be non-negative, got " << vns_perturbation_size;
    else if (ga_population_size <= 0)
        sout << "gaPopulationSize must be positive, got " << ga_population_size;
    else if (ga_elite_size < 0 || ga_elite_size > ga_population_size)
        sout << "gaEliteSize must be in [0, " << ga_population_size << "], got " << ga_elite_size;
    else if (!(ga_mutation_rate >= 0 && ga_mutation_rate <= 1))
        sout << "gaMutationRate must be in [0, 1], got " << ga_mutation_rate;
    else if (!(ga_crossover_rate >= 0 && ga_crossover_rate <= 1))
        sout << "gaCrossoverRate must be in [0, 1], got " << ga_crossover_rate;
    else if (ga_generations < -1)
        sout << "gaGenerations must be -1 or non-negative, got " << ga_generations;
    else if (ga_tournament_size <= 0)
        sout << "gaTournamentSize must be positive, got " << ga_tournament_size;
    else if (!(time_limit > 0))
        sout << "cutoffTime must be positive, got " << time_limit;
    else
        return;
    throw ConfigurationError("FlowShopOptions", sout.str());
}

local_search_policy parsePolicy(const string& name) {
    if (name == "best") return BEST_IMPROVEMENT;
    if (name == "first") return FIRST_IMPROVEMENT;
    throw ConfigurationError("FlowShopOptions",
                             "local search policy " + name + " does not exist (best, first)");
}

string policyName(local_search_policy policy) {
    return policy == FIRST_IMPROVEMENT ? "first" : "best";
}
