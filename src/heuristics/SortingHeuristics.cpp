#include "SortingHeuristics.h"

Sequence SPTHeuristic::build(const Instance& instance) const
{
	return sortJobsByKey(instance.getTotalProcessingTimes(), false);
}


Sequence LPTHeuristic::build(const Instance& instance) const
{
	return sortJobsByKey(instance.getTotalProcessingTimes(), true);
}


vector<double> PalmerHeuristic::slopeIndices(const Instance& instance)
{
	int m = instance.num_of_machines;
	vector<double> slopes(instance.num_of_jobs, 0);
	for (int job = 0; job < instance.num_of_jobs; job++)
	{
		double s = 0;
		for (int k = 1; k <= m; k++)
			s -= (m - (2 * k - 1)) * instance.getProcessingTime(job, k - 1);
		slopes[job] = s;
	}
	return slopes;
}


Sequence PalmerHeuristic::build(const Instance& instance) const
{
	return sortJobsByKey(slopeIndices(instance), true);
}


Sequence PendulumHeuristic::pendulumOrder(const vector<double>& totals)
{
	Sequence ascending = sortJobsByKey(totals, false);
	int n = (int)ascending.size();
	Sequence sequence(n);
	int front = 0;
	int back = n - 1;
	for (int i = 0; i < n; i++)
	{
		if (i % 2 == 0)
			sequence[front++] = ascending[i];
		else
			sequence[back--] = ascending[i];
	}
	return sequence;
}


Sequence PendulumHeuristic::build(const Instance& instance) const
{
	return pendulumOrder(instance.getTotalProcessingTimes());
}


Sequence RandomHeuristic::build(const Instance& instance) const
{
	std::mt19937 rng(seed);
	Sequence sequence = identitySequence(instance.num_of_jobs);
	std::shuffle(sequence.begin(), sequence.end(), rng);
	return sequence;
}
