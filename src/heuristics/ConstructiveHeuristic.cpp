#include "ConstructiveHeuristic.h"

#include <boost/algorithm/string/case_conv.hpp>

#include "FlowShopError.h"
#include "JohnsonRule.h"
#include "NEH.h"
#include "SortingHeuristics.h"

std::unique_ptr<ConstructiveHeuristic> createHeuristic(heuristic_type type, unsigned int seed)
{
	switch (type)
	{
		case NEH:
			return std::unique_ptr<ConstructiveHeuristic>(new NEHHeuristic());
		case PALMER:
			return std::unique_ptr<ConstructiveHeuristic>(new PalmerHeuristic());
		case CDS:
			return std::unique_ptr<ConstructiveHeuristic>(new CDSHeuristic());
		case JOHNSON:
			return std::unique_ptr<ConstructiveHeuristic>(new JohnsonHeuristic());
		case SPT:
			return std::unique_ptr<ConstructiveHeuristic>(new SPTHeuristic());
		case LPT:
			return std::unique_ptr<ConstructiveHeuristic>(new LPTHeuristic());
		case PENDULUM:
			return std::unique_ptr<ConstructiveHeuristic>(new PendulumHeuristic());
		case RANDOM:
			return std::unique_ptr<ConstructiveHeuristic>(new RandomHeuristic(seed));
		default:
			throw ConfigurationError("ConstructiveHeuristic",
			                         "unknown heuristic id " + std::to_string((int)type));
	}
}


heuristic_type parseHeuristicName(const string& name)
{
	string key = boost::algorithm::to_lower_copy(name);
	for (int i = 0; i < HEURISTIC_COUNT; i++)
	{
		if (boost::algorithm::to_lower_copy(heuristicName((heuristic_type)i)) == key)
			return (heuristic_type)i;
	}
	throw ConfigurationError("ConstructiveHeuristic", "heuristic " + name + " does not exist");
}


string heuristicName(heuristic_type type)
{
	switch (type)
	{
		case NEH: return "NEH";
		case PALMER: return "Palmer";
		case CDS: return "CDS";
		case JOHNSON: return "Johnson";
		case SPT: return "SPT";
		case LPT: return "LPT";
		case PENDULUM: return "Pendulum";
		case RANDOM: return "Random";
		default: return "Unknown";
	}
}
