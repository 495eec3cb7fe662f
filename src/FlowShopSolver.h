#pragma once
#include "ConstructiveHeuristic.h"
#include "ImprovementOperator.h"

struct MethodResult
{
    string method;
    Sequence sequence;
    double makespan;
    double runtime;
    MethodResult(const string& method, const Sequence& sequence, double makespan, double runtime) :
            method(method), sequence(sequence), makespan(makespan), runtime(runtime) {}
};

// Results of every method run so far, in insertion order.
class ResultTable
{
public:
    void add(const MethodResult& result) { results.push_back(result); }

    // ascending makespan, ties in insertion order
    vector<MethodResult> sorted() const;

    // lowest makespan, earliest on ties; throws FlowShopError when empty
    const MethodResult& best() const;

    const vector<MethodResult>& getResults() const { return results; }
    bool empty() const { return results.empty(); }
    size_t size() const { return results.size(); }

private:
    vector<MethodResult> results;
};

/**
 * Runs the selected constructive heuristics, then chains the selected
 * improvement operators, each one starting from the best sequence found so
 * far. Optionally runs the GA from a random population as one more method.
 */
class FlowShopSolver
{
public:
    ResultTable results;
    double runtime = 0;

    FlowShopSolver(const Instance& instance, const FlowShopOptions& options);

    // heuristics that do not apply to the instance (Johnson with m != 2) are
    // skipped; throws ConfigurationError if nothing produced a sequence
    const MethodResult& run(const vector<heuristic_type>& heuristics,
                            const vector<improvement_type>& improvements, bool standalone_ga = false);

    // recomputes the best makespan from scratch, throws FlowShopError on mismatch
    void validateSolution() const;
    void printResult() const;
    string getSolverName() const;

    unsigned int getSeed() const { return seed; }

private:
    const Instance& instance;
    FlowShopOptions options;
    unsigned int seed;
    std::mt19937 rng;

    vector<string> method_names;

    void runHeuristic(heuristic_type type);
    void runImprovement(improvement_type type);
    void runStandaloneGA();
};
