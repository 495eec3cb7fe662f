#pragma once
#include "common.h"

// Processing times of a permutation flow shop: one row per job, one column
// per machine. Validated on construction and immutable afterwards.
class Instance
{
public:
	int num_of_jobs = 0;
	int num_of_machines = 0;

	Instance(const TimeMatrix& processing_times, const vector<string>& job_names = vector<string>(),
	         const string& instance_name = "");
	// .txt/.fsp files are read as Taillard instances, anything else as a table
	explicit Instance(const string& fname);

	double getProcessingTime(int job, int machine) const { return processing_times[job][machine]; }
	const vector<double>& getJobTimes(int job) const { return processing_times[job]; }
	const TimeMatrix& getProcessingTimes() const { return processing_times; }

	double getTotalProcessingTime(int job) const { return job_totals[job]; }
	const vector<double>& getTotalProcessingTimes() const { return job_totals; }
	double getMachineLoad(int machine) const { return machine_loads[machine]; }
	double getTotalWork() const;

	const string& getJobName(int job) const { return job_names[job]; }
	const vector<string>& getJobNames() const { return job_names; }
	string getInstanceName() const { return instance_name; }

	void printInstance() const;

private:
	TimeMatrix processing_times;
	vector<string> job_names;
	vector<double> job_totals;
	vector<double> machine_loads;
	string instance_name;

	void loadTaillardFile(const vector<vector<string> >& rows);
	void loadTableFile(const vector<vector<string> >& rows);
	void validate();
};
