#include "common.h"

std::ostream& operator<<(std::ostream& os, const Sequence& sequence)
{
	for (size_t i = 0; i < sequence.size(); i++)
	{
		if (i > 0)
			os << ",";
		os << sequence[i];
	}
	return os;
}


bool isPermutation(const Sequence& sequence, int num_of_jobs)
{
	if ((int)sequence.size() != num_of_jobs)
		return false;
	vector<char> seen(num_of_jobs, 0);
	for (int job : sequence)
	{
		if (job < 0 || job >= num_of_jobs || seen[job])
			return false;
		seen[job] = 1;
	}
	return true;
}

Sequence identitySequence(int num_of_jobs)
{
	Sequence sequence(num_of_jobs);
	std::iota(sequence.begin(), sequence.end(), 0);
	return sequence;
}

Sequence sortJobsByKey(const vector<double>& keys, bool descending)
{
	Sequence jobs = identitySequence((int)keys.size());
	if (descending)
		std::stable_sort(jobs.begin(), jobs.end(),
		                 [&keys](int a, int b) { return keys[a] > keys[b]; });
	else
		std::stable_sort(jobs.begin(), jobs.end(),
		                 [&keys](int a, int b) { return keys[a] < keys[b]; });
	return jobs;
}

string sequenceToString(const Sequence& sequence, const vector<string>& job_names,
                        const string& separator)
{
	stringstream sout;
	for (size_t i = 0; i < sequence.size(); i++)
	{
		if (i > 0)
			sout << separator;
		int job = sequence[i];
		if (job >= 0 && job < (int)job_names.size())
			sout << job_names[job];
		else
			sout << job;
	}
	return sout.str();
}
