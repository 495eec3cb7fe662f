#include "Instance.h"

#include <cstdlib>

#include <boost/tokenizer.hpp>

#include "FlowShopError.h"
#include "Logger.h"

namespace
{
bool parseNumber(const string& token, double& value)
{
	if (token.empty())
		return false;
	char* end = nullptr;
	value = strtod(token.c_str(), &end);
	return end != token.c_str() && *end == '\0';
}

bool isNumericRow(const vector<string>& row)
{
	double value;
	for (const auto& token : row)
	{
		if (!parseNumber(token, value))
			return false;
	}
	return !row.empty();
}

// Row 0 is a header if it has text outside the name column, or if it starts
// with text and either the next row starts with a number or the rest of row 0
// counts machines 1, 2, ... ("Job,1,2").
bool isHeaderRow(const vector<vector<string> >& rows)
{
	if (rows.empty())
		return false;
	const auto& row = rows[0];
	double value;
	for (size_t c = 1; c < row.size(); c++)
	{
		if (!parseNumber(row[c], value))
			return true;
	}
	if (parseNumber(row[0], value))
		return false;
	if (row.size() == 1)
		return true;
	if (rows.size() > 1 && parseNumber(rows[1][0], value))
		return true;
	for (size_t c = 1; c < row.size(); c++)
	{
		parseNumber(row[c], value);
		if (value != (double)c)
			return false;
	}
	return true;
}

string defaultJobName(int job)
{
	return "Job_" + std::to_string(job + 1);
}
}


Instance::Instance(const TimeMatrix& processing_times, const vector<string>& job_names,
                   const string& instance_name) :
	processing_times(processing_times), job_names(job_names), instance_name(instance_name)
{
	validate();
}


Instance::Instance(const string& fname) : instance_name(fname)
{
	ifstream myfile(fname.c_str());
	if (!myfile.is_open())
		throw DimensionError("Instance", "cannot open instance file " + fname);

	typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
	boost::char_separator<char> sep(",;\t \r");
	vector<vector<string> > rows;
	string line;
	while (getline(myfile, line))
	{
		if (line.empty() || line[0] == '#')
			continue;
		tokenizer tok(line, sep);
		vector<string> row(tok.begin(), tok.end());
		if (!row.empty())
			rows.push_back(row);
	}
	myfile.close();

	string extension = fname.substr(fname.find_last_of('.') + 1);
	if (fname.find('.') != string::npos && (extension == "txt" || extension == "fsp"))
		loadTaillardFile(rows);
	else
		loadTableFile(rows);
	validate();
	log(1, "Loaded %s: %d jobs x %d machines\n", fname.c_str(), num_of_jobs, num_of_machines);
}


// first numeric row: "n m [seed ub lb]"; then n*m times, machine-major unless
// the rows clearly hold one job each
void Instance::loadTaillardFile(const vector<vector<string> >& rows)
{
	vector<vector<double> > numeric_rows;
	for (const auto& row : rows)
	{
		if (!isNumericRow(row))
			continue;  // Taillard headers such as "processing times :"
		vector<double> values(row.size());
		for (size_t i = 0; i < row.size(); i++)
			parseNumber(row[i], values[i]);
		numeric_rows.push_back(values);
	}
	if (numeric_rows.empty() || numeric_rows[0].size() < 2)
		throw DimensionError("Instance", "missing \"jobs machines\" header in " + instance_name);
	int n = (int)numeric_rows[0][0];
	int m = (int)numeric_rows[0][1];
	if (n <= 0 || m <= 0)
		throw DimensionError("Instance", "invalid header in " + instance_name);

	vector<double> values;
	bool job_major = ((int)numeric_rows.size() - 1 == n && n != m);
	if (n == m)
		log(1, "%s: %d x %d layout is ambiguous, reading machine-major\n", instance_name.c_str(), n, m);
	for (size_t r = 1; r < numeric_rows.size(); r++)
	{
		if (job_major && (int)numeric_rows[r].size() != m)
			job_major = false;
		values.insert(values.end(), numeric_rows[r].begin(), numeric_rows[r].end());
	}
	if ((int)values.size() != n * m)
	{
		stringstream sout;
		sout << instance_name << " declares " << n << "x" << m << " but holds " << values.size()
		     << " processing times";
		throw DimensionError("Instance", sout.str());
	}

	processing_times.assign(n, vector<double>(m, 0));
	for (int job = 0; job < n; job++)
	{
		for (int machine = 0; machine < m; machine++)
		{
			if (job_major)
				processing_times[job][machine] = values[job * m + machine];
			else
				processing_times[job][machine] = values[machine * n + job];
		}
	}
}


// one job per row, optional header row, optional leading name column
void Instance::loadTableFile(const vector<vector<string> >& rows)
{
	size_t first = isHeaderRow(rows) ? 1 : 0;
	for (size_t r = first; r < rows.size(); r++)
	{
		const auto& row = rows[r];
		double value;
		size_t c = 0;
		if (!parseNumber(row[0], value))
		{
			job_names.push_back(row[0]);
			c = 1;
		}
		else
		{
			job_names.push_back(defaultJobName((int)processing_times.size()));
		}
		vector<double> times;
		for (; c < row.size(); c++)
		{
			if (!parseNumber(row[c], value))
			{
				stringstream sout;
				sout << "non-numeric processing time \"" << row[c] << "\" at line " << r + 1 << " of "
				     << instance_name;
				throw DomainError("Instance", sout.str());
			}
			times.push_back(value);
		}
		processing_times.push_back(times);
	}
}


void Instance::validate()
{
	if (processing_times.empty())
		throw DimensionError("Instance", "processing time matrix has no jobs");
	num_of_jobs = (int)processing_times.size();
	num_of_machines = (int)processing_times[0].size();
	if (num_of_machines == 0)
		throw DimensionError("Instance", "processing time matrix has no machines");
	for (int job = 0; job < num_of_jobs; job++)
	{
		if ((int)processing_times[job].size() != num_of_machines)
		{
			stringstream sout;
			sout << "job " << job << " has " << processing_times[job].size() << " machines, expected "
			     << num_of_machines;
			throw DimensionError("Instance", sout.str());
		}
		for (int machine = 0; machine < num_of_machines; machine++)
		{
			double t = processing_times[job][machine];
			if (!std::isfinite(t) || t < 0)
			{
				stringstream sout;
				sout << "invalid processing time " << t << " at job " << job << ", machine " << machine;
				throw DomainError("Instance", sout.str());
			}
		}
	}

	if (job_names.empty())
	{
		for (int job = 0; job < num_of_jobs; job++)
			job_names.push_back(defaultJobName(job));
	}
	else if ((int)job_names.size() != num_of_jobs)
	{
		stringstream sout;
		sout << job_names.size() << " job names for " << num_of_jobs << " jobs";
		throw DimensionError("Instance", sout.str());
	}

	job_totals.assign(num_of_jobs, 0);
	machine_loads.assign(num_of_machines, 0);
	for (int job = 0; job < num_of_jobs; job++)
	{
		for (int machine = 0; machine < num_of_machines; machine++)
		{
			job_totals[job] += processing_times[job][machine];
			machine_loads[machine] += processing_times[job][machine];
		}
	}
}


double Instance::getTotalWork() const
{
	return std::accumulate(job_totals.begin(), job_totals.end(), 0.0);
}


void Instance::printInstance() const
{
	cout << "Instance " << instance_name << ": " << num_of_jobs << " jobs, " << num_of_machines
	     << " machines, total work " << getTotalWork() << endl;
	for (int job = 0; job < num_of_jobs; job++)
	{
		cout << "  " << std::setw(10) << std::left << job_names[job] << std::right;
		for (int machine = 0; machine < num_of_machines; machine++)
			cout << std::setw(8) << processing_times[job][machine];
		cout << "   (total " << job_totals[job] << ")" << endl;
	}
}
