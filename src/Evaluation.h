#pragma once
#include "Instance.h"

// Makespan and schedule statistics of permutation sequences.
namespace evaluation
{
// throws DimensionError unless every entry is a valid, distinct job index;
// with require_all the sequence must also cover every job
void validateSequence(const Sequence& sequence, const Instance& instance, bool require_all,
                      const string& component = "Evaluation");

// C[i][j]: completion time of the i-th scheduled job on machine j
TimeMatrix completionMatrix(const Sequence& sequence, const Instance& instance);

// completion time of the last job on the last machine; full permutations only
double makespan(const Sequence& sequence, const Instance& instance);

// makespan of a subset of distinct jobs, 0 for the empty sequence
double partialMakespan(const Sequence& sequence, const Instance& instance);

// Incremental evaluation after a local change. Rows [0, first) of completion
// must already hold the completion times of sequence; only positions from
// first onward are rescheduled. Throws DimensionError if completion does not
// match the sequence or first is out of range.
double makespanFrom(const Sequence& sequence, const TimeMatrix& completion, int first,
                    const Instance& instance);
// same as makespanFrom, but rewrites rows [first, n) of completion in place
void updateCompletion(const Sequence& sequence, TimeMatrix& completion, int first,
                      const Instance& instance);

// idle time of each machine in [0, makespan]
vector<double> machineUtilization(const Sequence& sequence, const Instance& instance);

// busy time / makespan per machine, 0 when the makespan is 0
vector<double> machineBusyRatio(const Sequence& sequence, const Instance& instance);

// machine with the least idle time, lowest index on ties
int bottleneckMachine(const Sequence& sequence, const Instance& instance);
}
