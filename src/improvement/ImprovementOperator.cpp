#include "ImprovementOperator.h"

#include <boost/algorithm/string/case_conv.hpp>

#include "BottleneckSearch.h"
#include "FlowShopError.h"
#include "GeneticAlgorithm.h"
#include "LocalSearch.h"
#include "Logger.h"
#include "VNS.h"

ImprovementOperator::ImprovementOperator(const Instance& instance, double time_limit, int screen) :
	instance(instance), time_limit(time_limit), screen(screen)
{
	if (time_limit <= 0)
		throw ConfigurationError("ImprovementOperator", "time limit must be positive");
}


void ImprovementOperator::startClock()
{
	start_time = getTime();
	num_of_iteration = 0;
	iteration_stats.clear();
	runtime = 0;
}


bool ImprovementOperator::timeout() const
{
	return getTime() - start_time >= time_limit;
}


void ImprovementOperator::recordIteration(double makespan, const string& phase)
{
	runtime = getTime() - start_time;
	iteration_stats.emplace_back(num_of_iteration, makespan, runtime, phase);
	if (screen >= 2)
	{
		cout << getSolverName() << " iteration " << num_of_iteration << ", " << phase
		     << ", makespan = " << makespan << ", runtime = " << runtime << endl;
	}
}


std::unique_ptr<ImprovementOperator> createImprovementOperator(improvement_type type,
                                                               const Instance& instance,
                                                               const FlowShopOptions& options)
{
	options.validate();
	switch (type)
	{
		case TWO_OPT:
			return std::unique_ptr<ImprovementOperator>(new TwoOptSearch(
				instance, options.max_iterations, options.policy, options.time_limit, options.screen));
		case INSERTION:
			return std::unique_ptr<ImprovementOperator>(new InsertionSearch(
				instance, options.max_iterations, options.policy, options.time_limit, options.screen));
		case BOTTLENECK_SWAP:
			return std::unique_ptr<ImprovementOperator>(new BottleneckSearch(
				instance, options.max_iterations, options.policy, options.time_limit, options.screen));
		case VNS_SEARCH:
			return std::unique_ptr<ImprovementOperator>(new VNS(instance, options));
		case GENETIC:
			return std::unique_ptr<ImprovementOperator>(new GeneticAlgorithm(instance, options));
		default:
			throw ConfigurationError("ImprovementOperator",
			                         "unknown improvement id " + std::to_string((int)type));
	}
}


improvement_type parseImprovementName(const string& name)
{
	string key = boost::algorithm::to_lower_copy(name);
	if (key == "2-opt" || key == "twoopt")
		return TWO_OPT;
	for (int i = 0; i < IMPROVEMENT_COUNT; i++)
	{
		if (boost::algorithm::to_lower_copy(improvementName((improvement_type)i)) == key)
			return (improvement_type)i;
	}
	throw ConfigurationError("ImprovementOperator", "improvement " + name + " does not exist");
}


string improvementName(improvement_type type)
{
	switch (type)
	{
		case TWO_OPT: return "2opt";
		case INSERTION: return "Insertion";
		case BOTTLENECK_SWAP: return "Bottleneck";
		case VNS_SEARCH: return "VNS";
		case GENETIC: return "GA";
		default: return "Unknown";
	}
}
