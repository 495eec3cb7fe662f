#pragma once
#include "Instance.h"
#include "defines.h"

enum improvement_type {
    TWO_OPT,
    INSERTION,
    BOTTLENECK_SWAP,
    VNS_SEARCH,
    GENETIC,
    IMPROVEMENT_COUNT
};

struct ImprovementResult
{
    Sequence sequence;
    double makespan = MAX_MAKESPAN;
    int iterations = 0;
};

// Refines a start sequence. The returned sequence is never worse than the
// start sequence.
class ImprovementOperator
{
public:
    // statistics
    int num_of_iteration = 0;
    list<IterationStats> iteration_stats; // best makespan after each iteration
    double runtime = 0;

    ImprovementOperator(const Instance& instance, double time_limit, int screen);
    virtual ~ImprovementOperator() = default;

    virtual improvement_type getType() const = 0;
    virtual string getSolverName() const = 0;

    // throws DimensionError if start is not a permutation of the jobs
    virtual ImprovementResult improve(const Sequence& start, std::mt19937& rng) = 0;

    void setTimeLimit(double seconds) { time_limit = seconds; }

protected:
    // input params
    const Instance& instance; // avoid making copies of this variable as much as possible
    double time_limit;
    int screen;

    double start_time = 0;

    void startClock();
    bool timeout() const;
    void recordIteration(double makespan, const string& phase);
};

std::unique_ptr<ImprovementOperator> createImprovementOperator(improvement_type type,
                                                               const Instance& instance,
                                                               const FlowShopOptions& options);

// accepts "2opt", "Insertion", "Bottleneck", "VNS" and "GA", case-insensitive
improvement_type parseImprovementName(const string& name);
string improvementName(improvement_type type);
