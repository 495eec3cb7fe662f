#pragma once
#include "LocalSearch.h"

// Adjacent swaps ranked by how much they differ on the most loaded machine,
// evaluated incrementally from the swapped position onward. When the swaps
// stall, a near-neutral swap of the top ranked pair and windowed insertions
// are tried before giving up.
class BottleneckSearch : public LocalSearch
{
public:
    BottleneckSearch(const Instance& instance, int max_iterations, local_search_policy policy,
                     double time_limit, int screen);

    improvement_type getType() const override { return BOTTLENECK_SWAP; }
    string getSolverName() const override { return "Bottleneck(" + policyName(policy) + ")"; }

    ImprovementResult improve(const Sequence& start, std::mt19937& rng) override;

    // pairs (i, i + 1)
    vector<Move> generateMoves(int num_of_jobs) const override;
    void applyMove(Sequence& sequence, const Move& move) const override;

    // machine with the largest total processing time, lowest index on ties
    int heaviestMachine() const;

    // swap priority of the pair at positions pos and pos + 1, higher first
    double scorePair(const Sequence& sequence, int pos) const;
    // adjacent pair positions by descending score, ties by position
    vector<int> rankPairs(const Sequence& sequence) const;

private:
    // score terms of the current instance
    int bottleneck = 0;
    double critical_time = 0; // 80th percentile of the bottleneck times

    // a perturbation may worsen the makespan by at most this fraction
    static constexpr double MAX_WORSENING = 0.002;
    static constexpr int INSERTION_CANDIDATES = 10;
    static constexpr int INSERTION_WINDOW = 14;
    static constexpr int FOCUS_WINDOW = 18;

    double swapMakespan(const Sequence& sequence, const TimeMatrix& completion, int pos) const;
    void commitSwap(Sequence& sequence, TimeMatrix& completion, int pos) const;

    // best or first improving swaps over the ranked pairs until none improves
    bool intensify(Sequence& sequence, TimeMatrix& completion, double& makespan) const;
    // swap of the top ranked pair unless it worsens the makespan by more than MAX_WORSENING
    bool perturb(Sequence& sequence, TimeMatrix& completion, double& makespan,
                 const vector<int>& ranked) const;
    bool windowedInsertion(Sequence& sequence, TimeMatrix& completion, double& makespan,
                           const vector<int>& ranked) const;
    // improving swaps around the top ranked pair until a sweep finds none
    bool focusWindow(Sequence& sequence, TimeMatrix& completion, double& makespan) const;
};
