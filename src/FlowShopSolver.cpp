#include "FlowShopSolver.h"

#include <cstdio>

#include "Evaluation.h"
#include "FlowShopError.h"
#include "GeneticAlgorithm.h"
#include "Logger.h"

vector<MethodResult> ResultTable::sorted() const
{
	vector<MethodResult> table(results);
	std::stable_sort(table.begin(), table.end(), [](const MethodResult& a, const MethodResult& b) {
		return a.makespan < b.makespan;
	});
	return table;
}


const MethodResult& ResultTable::best() const
{
	if (results.empty())
		throw FlowShopError("ResultTable", "no result recorded");
	size_t best = 0;
	for (size_t i = 1; i < results.size(); i++)
	{
		if (results[i].makespan < results[best].makespan)
			best = i;
	}
	return results[best];
}


FlowShopSolver::FlowShopSolver(const Instance& instance, const FlowShopOptions& options) :
	instance(instance), options(options), seed(options.getSeed()), rng(seed)
{
	this->options.validate();
}


const MethodResult& FlowShopSolver::run(const vector<heuristic_type>& heuristics,
                                        const vector<improvement_type>& improvements, bool standalone_ga)
{
	if (heuristics.empty() && !standalone_ga)
		throw ConfigurationError("FlowShopSolver", "no constructive heuristic selected");

	double start_time = getTime();
	for (auto type : heuristics)
		runHeuristic(type);
	if (standalone_ga)
		runStandaloneGA();
	if (results.empty())
		throw ConfigurationError("FlowShopSolver", "none of the selected heuristics applies to this instance");

	for (auto type : improvements)
		runImprovement(type);
	runtime = getTime() - start_time;
	return results.best();
}


void FlowShopSolver::runHeuristic(heuristic_type type)
{
	auto heuristic = createHeuristic(type, seed);
	double t = getTime();
	try
	{
		Sequence sequence = heuristic->build(instance);
		double cmax = evaluation::makespan(sequence, instance);
		results.add(MethodResult(heuristic->getName(), sequence, cmax, getTime() - t));
		method_names.push_back(heuristic->getName());
		log(1, "%s: makespan %.2f\n", heuristic->getName().c_str(), cmax);
		if (options.screen >= 2)
			cout << heuristic->getName() << " sequence: " << sequence << endl;
	}
	catch (const DimensionError& e)
	{
		log(0, "Skip %s: %s\n", heuristic->getName().c_str(), e.what());
	}
}


void FlowShopSolver::runImprovement(improvement_type type)
{
	auto improvement = createImprovementOperator(type, instance, options);
	const MethodResult& start = results.best();
	string method = start.method + "+" + improvementName(type);
	Sequence start_sequence = start.sequence;

	double t = getTime();
	ImprovementResult result = improvement->improve(start_sequence, rng);
	results.add(MethodResult(method, result.sequence, result.makespan, getTime() - t));
	method_names.push_back(improvementName(type));
	log(1, "%s: makespan %.2f after %d iterations\n", method.c_str(), result.makespan, result.iterations);
}


void FlowShopSolver::runStandaloneGA()
{
	GeneticAlgorithm ga(instance, options);
	double t = getTime();
	ImprovementResult result = ga.runStandalone(rng);
	results.add(MethodResult("GA(standalone)", result.sequence, result.makespan, getTime() - t));
	method_names.push_back("GA(standalone)");
	log(1, "GA(standalone): makespan %.2f after %d generations\n", result.makespan, result.iterations);
}


void FlowShopSolver::validateSolution() const
{
	const MethodResult& best = results.best();
	evaluation::validateSequence(best.sequence, instance, true, "FlowShopSolver");
	double cmax = evaluation::makespan(best.sequence, instance);
	if (std::abs(cmax - best.makespan) > 1e-9 * max(1.0, cmax))
	{
		stringstream sout;
		sout << "method " << best.method << " reports makespan " << best.makespan
		     << " but its sequence has makespan " << cmax;
		throw FlowShopError("FlowShopSolver", sout.str());
	}
}


void FlowShopSolver::printResult() const
{
	const MethodResult& best = results.best();
	printf("%-4s %-32s %12s %10s  %s\n", "rank", "method", "makespan", "runtime", "sequence");
	int rank = 1;
	for (const auto& r : results.sorted())
	{
		printf("%-4d %-32s %12.2f %10.3f  %s\n", rank++, r.method.c_str(), r.makespan, r.runtime,
		       sequenceToString(r.sequence, instance.getJobNames()).c_str());
	}

	cout << endl << "Best sequence (" << best.method << "): "
	     << sequenceToString(best.sequence, instance.getJobNames()) << endl;
	vector<double> idle = evaluation::machineUtilization(best.sequence, instance);
	vector<double> busy = evaluation::machineBusyRatio(best.sequence, instance);
	int bottleneck = evaluation::bottleneckMachine(best.sequence, instance);
	for (int machine = 0; machine < instance.num_of_machines; machine++)
	{
		printf("machine %d: idle %.2f, busy %.1f%%%s\n", machine + 1, idle[machine], busy[machine] * 100,
		       machine == bottleneck ? " (bottleneck)" : "");
	}

	cout.setf(std::ios::fixed, std::ios::floatfield);
	cout << std::setprecision(3);
	cout << "final"
	     << " makespan " << best.makespan << " method " << best.method << " jobs " << instance.num_of_jobs
	     << " machines " << instance.num_of_machines << " bottleneck " << bottleneck + 1 << " seed " << seed
	     << " total " << runtime << endl;
}


string FlowShopSolver::getSolverName() const
{
	string name = "FlowShop(";
	for (size_t i = 0; i < method_names.size(); i++)
	{
		if (i > 0)
			name += ";";
		name += method_names[i];
	}
	return name + ")";
}
