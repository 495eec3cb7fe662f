#pragma once
#include <list>
#include <vector>
#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <numeric>
#include <limits>
#include <random>
#include <memory>
#include <cmath>

using std::vector;
using std::list;
using std::string;
using std::ostream;
using std::stringstream;
using std::ifstream;
using std::cout;
using std::cerr;
using std::endl;
using std::min;
using std::max;

typedef vector<int> Sequence;                // job indices in processing order
typedef vector<vector<double> > TimeMatrix;  // rows: jobs (or scheduled positions), cols: machines

#define MAX_MAKESPAN std::numeric_limits<double>::max()

struct IterationStats
{
    int iteration;
    double makespan;
    double runtime;
    string algorithm;
    IterationStats(int iteration, double makespan, double runtime, const string& algorithm) :
            iteration(iteration), makespan(makespan), runtime(runtime), algorithm(algorithm) {}
};

std::ostream& operator<<(std::ostream& os, const Sequence& sequence);

// true if sequence holds every index of [0, num_of_jobs) exactly once
bool isPermutation(const Sequence& sequence, int num_of_jobs);

Sequence identitySequence(int num_of_jobs);

// stable ordering of job indices by key, ties keep ascending index order
Sequence sortJobsByKey(const vector<double>& keys, bool descending);

string sequenceToString(const Sequence& sequence, const vector<string>& job_names,
                        const string& separator = " -> ");
