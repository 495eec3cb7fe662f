#pragma once
#include "ImprovementOperator.h"

// Repeated neighborhood scans until no move improves the makespan or the
// iteration budget is spent. Each scan applies at most one move.
class LocalSearch : public ImprovementOperator
{
public:
    struct Move
    {
        int from;
        int to;
        Move(int from, int to) : from(from), to(to) {}
    };

    LocalSearch(const Instance& instance, int max_iterations, local_search_policy policy,
                double time_limit, int screen);

    ImprovementResult improve(const Sequence& start, std::mt19937& rng) override;

    // one scan over the neighborhood in scan order; returns true if a move was applied
    bool scan(Sequence& sequence, double& makespan) const;

    // all moves of a sequence with num_of_jobs jobs, in scan order
    virtual vector<Move> generateMoves(int num_of_jobs) const = 0;
    virtual void applyMove(Sequence& sequence, const Move& move) const = 0;

protected:
    int max_iterations;
    local_search_policy policy;
};

// swap of two positions i < j
class TwoOptSearch : public LocalSearch
{
public:
    using LocalSearch::LocalSearch;

    improvement_type getType() const override { return TWO_OPT; }
    string getSolverName() const override { return "2opt(" + policyName(policy) + ")"; }

    vector<Move> generateMoves(int num_of_jobs) const override;
    void applyMove(Sequence& sequence, const Move& move) const override;
};

// job at position i removed and reinserted at position j != i
class InsertionSearch : public LocalSearch
{
public:
    using LocalSearch::LocalSearch;

    improvement_type getType() const override { return INSERTION; }
    string getSolverName() const override { return "Insertion(" + policyName(policy) + ")"; }

    vector<Move> generateMoves(int num_of_jobs) const override;
    void applyMove(Sequence& sequence, const Move& move) const override;
};
