#pragma once
#include "ImprovementOperator.h"

// A sequence with its cached makespan. Changing the sequence drops the cache.
class Individual
{
public:
    Individual() = default;
    explicit Individual(const Sequence& sequence) : sequence(sequence) {}

    const Sequence& getSequence() const { return sequence; }
    void setSequence(const Sequence& new_sequence);
    void swapPositions(int a, int b);

    void evaluate(const Instance& instance);
    bool isEvaluated() const { return evaluated; }

    // throw FlowShopError if the individual has not been evaluated
    double getMakespan() const;
    double getFitness() const; // 1 / (1 + makespan)

private:
    Sequence sequence;
    double makespan = MAX_MAKESPAN;
    bool evaluated = false;
};

typedef vector<Individual> Population;

/**
 * Generational GA with elitism, tournament selection, order crossover and
 * swap mutation. Seeded by improve() (the start sequence joins the initial
 * population) or unseeded by runStandalone(). The random stream is only
 * drawn on the calling thread, so a fixed seed gives a fixed result.
 */
class GeneticAlgorithm : public ImprovementOperator
{
public:
    vector<double> best_history; // best makespan seen after each generation

    GeneticAlgorithm(const Instance& instance, const FlowShopOptions& options);

    improvement_type getType() const override { return GENETIC; }
    string getSolverName() const override { return "GA"; }

    ImprovementResult improve(const Sequence& start, std::mt19937& rng) override;
    ImprovementResult runStandalone(std::mt19937& rng);

    /**
     * OX: positions [cut1, cut2] are copied from parent a, the remaining
     * positions are filled from cut2 + 1 onwards (wrapping) with the jobs of
     * parent b in b's order, also starting after cut2.
     */
    static Sequence orderCrossover(const Sequence& a, const Sequence& b, int cut1, int cut2);

    // best of tournament_size uniform draws with replacement, first drawn on ties
    static int tournamentSelect(const Population& population, int tournament_size, std::mt19937& rng);

private:
    int population_size;
    int elite_size;
    double crossover_rate;
    double mutation_rate;
    int tournament_size;
    int seeded_generations;
    int standalone_generations;

    ImprovementResult run(const Sequence* seed, int generations, std::mt19937& rng);
    void initPopulation(Population& population, const Sequence* seed, std::mt19937& rng) const;
    void evaluatePopulation(Population& population) const;
    void mutate(Individual& individual, std::mt19937& rng) const;
};
