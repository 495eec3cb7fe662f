#pragma once
#include "ConstructiveHeuristic.h"

// shortest total processing time first
class SPTHeuristic : public ConstructiveHeuristic
{
public:
    heuristic_type getType() const override { return SPT; }
    string getName() const override { return "SPT"; }
    Sequence build(const Instance& instance) const override;
};

// longest total processing time first
class LPTHeuristic : public ConstructiveHeuristic
{
public:
    heuristic_type getType() const override { return LPT; }
    string getName() const override { return "LPT"; }
    Sequence build(const Instance& instance) const override;
};

/**
 * Palmer's slope index. Jobs whose times grow towards the last machines get a
 * large slope S_j = -sum_k (m - (2k - 1)) * p[j][k] and are scheduled first.
 */
class PalmerHeuristic : public ConstructiveHeuristic
{
public:
    heuristic_type getType() const override { return PALMER; }
    string getName() const override { return "Palmer"; }
    Sequence build(const Instance& instance) const override;

    static vector<double> slopeIndices(const Instance& instance);
};

/**
 * Ascending by total time, then dealt alternately to the front and the back
 * of the sequence so the longest jobs end up in the middle.
 */
class PendulumHeuristic : public ConstructiveHeuristic
{
public:
    heuristic_type getType() const override { return PENDULUM; }
    string getName() const override { return "Pendulum"; }
    Sequence build(const Instance& instance) const override;

    static Sequence pendulumOrder(const vector<double>& totals);
};

// uniform random permutation, reproducible for a fixed seed
class RandomHeuristic : public ConstructiveHeuristic
{
public:
    explicit RandomHeuristic(unsigned int seed) : seed(seed) {}
    heuristic_type getType() const override { return RANDOM; }
    string getName() const override { return "Random"; }
    Sequence build(const Instance& instance) const override;

private:
    unsigned int seed;
};
