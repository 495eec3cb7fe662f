#include "Evaluation.h"
#include "FlowShopError.h"

namespace evaluation
{
namespace
{
// single row recurrence: row[j] holds C[i-1][j] on entry and C[i][j] on exit
inline void scheduleJob(const vector<double>& times, vector<double>& row)
{
	row[0] += times[0];
	for (size_t j = 1; j < row.size(); j++)
		row[j] = max(row[j], row[j - 1]) + times[j];
}


// row of completion times just before position first
vector<double> prefixRow(const Sequence& sequence, const TimeMatrix& completion, int first,
                         const Instance& instance)
{
	validateSequence(sequence, instance, true);
	if (completion.size() != sequence.size())
	{
		stringstream sout;
		sout << "completion matrix has " << completion.size() << " rows, sequence has " << sequence.size();
		throw DimensionError("Evaluation", sout.str());
	}
	if (first < 0 || first >= (int)sequence.size())
	{
		throw DimensionError("Evaluation", "first position " + std::to_string(first) +
		                     " out of range for " + std::to_string(sequence.size()) + " jobs");
	}
	if (first == 0)
		return vector<double>(instance.num_of_machines, 0);
	if ((int)completion[first - 1].size() != instance.num_of_machines)
		throw DimensionError("Evaluation", "completion row width does not match the machine count");
	return completion[first - 1];
}
}


void validateSequence(const Sequence& sequence, const Instance& instance, bool require_all,
                      const string& component)
{
	if (require_all && (int)sequence.size() != instance.num_of_jobs)
	{
		stringstream sout;
		sout << "sequence has " << sequence.size() << " jobs, instance has " << instance.num_of_jobs;
		throw DimensionError(component, sout.str());
	}
	vector<char> seen(instance.num_of_jobs, 0);
	for (int job : sequence)
	{
		if (job < 0 || job >= instance.num_of_jobs)
			throw DimensionError(component, "job index " + std::to_string(job) + " out of range");
		if (seen[job])
			throw DimensionError(component, "job " + std::to_string(job) + " appears twice");
		seen[job] = 1;
	}
}


TimeMatrix completionMatrix(const Sequence& sequence, const Instance& instance)
{
	validateSequence(sequence, instance, true);
	TimeMatrix completion;
	completion.reserve(sequence.size());
	vector<double> row(instance.num_of_machines, 0);
	for (int job : sequence)
	{
		scheduleJob(instance.getJobTimes(job), row);
		completion.push_back(row);
	}
	return completion;
}


double makespan(const Sequence& sequence, const Instance& instance)
{
	validateSequence(sequence, instance, true);
	vector<double> row(instance.num_of_machines, 0);
	for (int job : sequence)
		scheduleJob(instance.getJobTimes(job), row);
	return row.back();
}


double partialMakespan(const Sequence& sequence, const Instance& instance)
{
	validateSequence(sequence, instance, false);
	if (sequence.empty())
		return 0;
	vector<double> row(instance.num_of_machines, 0);
	for (int job : sequence)
		scheduleJob(instance.getJobTimes(job), row);
	return row.back();
}


double makespanFrom(const Sequence& sequence, const TimeMatrix& completion, int first,
                    const Instance& instance)
{
	vector<double> row = prefixRow(sequence, completion, first, instance);
	for (size_t i = first; i < sequence.size(); i++)
		scheduleJob(instance.getJobTimes(sequence[i]), row);
	return row.back();
}


void updateCompletion(const Sequence& sequence, TimeMatrix& completion, int first,
                      const Instance& instance)
{
	vector<double> row = prefixRow(sequence, completion, first, instance);
	for (size_t i = first; i < sequence.size(); i++)
	{
		scheduleJob(instance.getJobTimes(sequence[i]), row);
		completion[i] = row;
	}
}


vector<double> machineUtilization(const Sequence& sequence, const Instance& instance)
{
	double cmax = makespan(sequence, instance);
	vector<double> idle(instance.num_of_machines);
	for (int machine = 0; machine < instance.num_of_machines; machine++)
		idle[machine] = cmax - instance.getMachineLoad(machine);
	return idle;
}


vector<double> machineBusyRatio(const Sequence& sequence, const Instance& instance)
{
	double cmax = makespan(sequence, instance);
	vector<double> ratio(instance.num_of_machines, 0);
	if (cmax <= 0)
		return ratio;
	for (int machine = 0; machine < instance.num_of_machines; machine++)
		ratio[machine] = instance.getMachineLoad(machine) / cmax;
	return ratio;
}


int bottleneckMachine(const Sequence& sequence, const Instance& instance)
{
	vector<double> idle = machineUtilization(sequence, instance);
	return (int)(std::min_element(idle.begin(), idle.end()) - idle.begin());
}
}
