#include "JohnsonRule.h"
#include "Evaluation.h"
#include "FlowShopError.h"
#include "Logger.h"

Sequence johnsonsRule(const vector<double>& times1, const vector<double>& times2)
{
	if (times1.size() != times2.size())
	{
		stringstream sout;
		sout << times1.size() << " times on machine 1 but " << times2.size() << " on machine 2";
		throw DimensionError("Johnson", sout.str());
	}
	Sequence first, last;
	for (int job = 0; job < (int)times1.size(); job++)
	{
		if (times1[job] <= times2[job])
			first.push_back(job);
		else
			last.push_back(job);
	}
	std::stable_sort(first.begin(), first.end(),
	                 [&times1](int a, int b) { return times1[a] < times1[b]; });
	std::stable_sort(last.begin(), last.end(),
	                 [&times2](int a, int b) { return times2[a] > times2[b]; });
	first.insert(first.end(), last.begin(), last.end());
	return first;
}


Sequence JohnsonHeuristic::build(const Instance& instance) const
{
	if (instance.num_of_machines != 2)
	{
		throw DimensionError("Johnson", "Johnson's rule needs exactly 2 machines, instance has " +
		                                std::to_string(instance.num_of_machines));
	}
	vector<double> times1(instance.num_of_jobs), times2(instance.num_of_jobs);
	for (int job = 0; job < instance.num_of_jobs; job++)
	{
		times1[job] = instance.getProcessingTime(job, 0);
		times2[job] = instance.getProcessingTime(job, 1);
	}
	return johnsonsRule(times1, times2);
}


Sequence CDSHeuristic::buildForSplit(const Instance& instance, int k)
{
	if (k < 1 || k >= instance.num_of_machines)
	{
		throw DimensionError("CDS", "split " + std::to_string(k) + " outside [1, " +
		                            std::to_string(instance.num_of_machines - 1) + "]");
	}
	vector<double> times1(instance.num_of_jobs, 0), times2(instance.num_of_jobs, 0);
	for (int job = 0; job < instance.num_of_jobs; job++)
	{
		for (int machine = 0; machine < instance.num_of_machines; machine++)
		{
			if (machine < k)
				times1[job] += instance.getProcessingTime(job, machine);
			else
				times2[job] += instance.getProcessingTime(job, machine);
		}
	}
	return johnsonsRule(times1, times2);
}


Sequence CDSHeuristic::build(const Instance& instance) const
{
	if (instance.num_of_machines == 1)
		return identitySequence(instance.num_of_jobs);

	Sequence best_sequence;
	double best_makespan = MAX_MAKESPAN;
	for (int k = 1; k < instance.num_of_machines; k++)
	{
		Sequence sequence = buildForSplit(instance, k);
		double cmax = evaluation::makespan(sequence, instance);
		log(2, "CDS split %d: makespan %.2f\n", k, cmax);
		if (cmax < best_makespan)
		{
			best_makespan = cmax;
			best_sequence = sequence;
		}
	}
	return best_sequence;
}
