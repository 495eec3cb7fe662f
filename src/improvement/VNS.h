#pragma once
#include "LocalSearch.h"

enum vns_state {
    EXPLOIT_TWO_OPT,
    EXPLOIT_INSERTION,
    PERTURB,
    DONE
};

/**
 * Variable neighborhood search over the 2-opt and insertion neighborhoods.
 * A cycle runs 2-opt and then insertion to a local optimum. A cycle that
 * improves the best sequence restarts from it; otherwise the best sequence
 * is perturbed by random swaps. Stops after vns_max_iterations consecutive
 * failed cycles, after ten times as many cycles in total, or on timeout.
 */
class VNS : public ImprovementOperator
{
public:
    int num_of_failures = 0; // cycles that did not improve the best sequence
    int num_of_consecutive_failures = 0;

    VNS(const Instance& instance, const FlowShopOptions& options);

    improvement_type getType() const override { return VNS_SEARCH; }
    string getSolverName() const override { return "VNS"; }

    ImprovementResult improve(const Sequence& start, std::mt19937& rng) override;

    // k uniform position swaps
    static void perturb(Sequence& sequence, int k, std::mt19937& rng);

private:
    int max_iterations;
    int perturbation_size;

    TwoOptSearch two_opt;
    InsertionSearch insertion;

    void runLocalSearch(LocalSearch& search, Sequence& sequence, double& makespan, std::mt19937& rng);
};
