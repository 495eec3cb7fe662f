#include "NEH.h"
#include "Evaluation.h"

int NEHHeuristic::bestInsertionPosition(const Sequence& partial, int job, const Instance& instance,
                                        double& best_makespan)
{
	int num_positions = (int)partial.size() + 1;
	vector<double> makespans(num_positions);
	#pragma omp parallel for if (num_positions > 32)
	for (int pos = 0; pos < num_positions; pos++)
	{
		Sequence candidate(partial);
		candidate.insert(candidate.begin() + pos, job);
		makespans[pos] = evaluation::partialMakespan(candidate, instance);
	}

	int best_pos = 0;
	best_makespan = makespans[0];
	for (int pos = 1; pos < num_positions; pos++)
	{
		if (makespans[pos] < best_makespan)
		{
			best_makespan = makespans[pos];
			best_pos = pos;
		}
	}
	return best_pos;
}


Sequence NEHHeuristic::build(const Instance& instance) const
{
	Sequence order = sortJobsByKey(instance.getTotalProcessingTimes(), true);
	Sequence sequence;
	sequence.reserve(order.size());
	sequence.push_back(order[0]);
	for (size_t i = 1; i < order.size(); i++)
	{
		double cmax;
		int pos = bestInsertionPosition(sequence, order[i], instance, cmax);
		sequence.insert(sequence.begin() + pos, order[i]);
	}
	return sequence;
}
