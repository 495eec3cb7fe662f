#include "LocalSearch.h"
#include "Evaluation.h"
#include "FlowShopError.h"
#include "Logger.h"

LocalSearch::LocalSearch(const Instance& instance, int max_iterations, local_search_policy policy,
                         double time_limit, int screen) :
	ImprovementOperator(instance, time_limit, screen), max_iterations(max_iterations), policy(policy)
{
	if (max_iterations <= 0)
	{
		throw ConfigurationError("LocalSearch",
		                         "maxIterations must be positive, got " + std::to_string(max_iterations));
	}
}


ImprovementResult LocalSearch::improve(const Sequence& start, std::mt19937& /*rng*/)
{
	evaluation::validateSequence(start, instance, true, getSolverName());
	startClock();
	ImprovementResult result;
	result.sequence = start;
	result.makespan = evaluation::makespan(start, instance);
	while (num_of_iteration < max_iterations && !timeout())
	{
		num_of_iteration++;
		if (!scan(result.sequence, result.makespan))
			break;
		recordIteration(result.makespan, getSolverName());
	}
	runtime = getTime() - start_time;
	result.iterations = num_of_iteration;
	if (screen >= 1)
	{
		cout << getSolverName() << ": makespan = " << result.makespan << ", scans = "
		     << num_of_iteration << ", runtime = " << runtime << endl;
	}
	return result;
}


bool LocalSearch::scan(Sequence& sequence, double& makespan) const
{
	vector<Move> moves = generateMoves((int)sequence.size());
	if (moves.empty())
		return false;

	if (policy == FIRST_IMPROVEMENT)
	{
		Sequence candidate;
		for (const auto& move : moves)
		{
			candidate = sequence;
			applyMove(candidate, move);
			double cmax = evaluation::makespan(candidate, instance);
			if (cmax < makespan)
			{
				sequence.swap(candidate);
				makespan = cmax;
				return true;
			}
		}
		return false;
	}

	int num_moves = (int)moves.size();
	vector<double> makespans(num_moves);
	#pragma omp parallel for if (num_moves > 256)
	for (int i = 0; i < num_moves; i++)
	{
		Sequence candidate(sequence);
		applyMove(candidate, moves[i]);
		makespans[i] = evaluation::makespan(candidate, instance);
	}

	int best = -1;
	double best_makespan = makespan;
	for (int i = 0; i < num_moves; i++)
	{
		if (makespans[i] < best_makespan)
		{
			best_makespan = makespans[i];
			best = i;
		}
	}
	if (best < 0)
		return false;
	applyMove(sequence, moves[best]);
	makespan = best_makespan;
	return true;
}


vector<LocalSearch::Move> TwoOptSearch::generateMoves(int num_of_jobs) const
{
	vector<Move> moves;
	for (int i = 0; i < num_of_jobs; i++)
	{
		for (int j = i + 1; j < num_of_jobs; j++)
			moves.emplace_back(i, j);
	}
	return moves;
}


void TwoOptSearch::applyMove(Sequence& sequence, const Move& move) const
{
	std::swap(sequence[move.from], sequence[move.to]);
}


vector<LocalSearch::Move> InsertionSearch::generateMoves(int num_of_jobs) const
{
	vector<Move> moves;
	for (int i = 0; i < num_of_jobs; i++)
	{
		for (int j = 0; j < num_of_jobs; j++)
		{
			if (j != i)
				moves.emplace_back(i, j);
		}
	}
	return moves;
}


void InsertionSearch::applyMove(Sequence& sequence, const Move& move) const
{
	int job = sequence[move.from];
	sequence.erase(sequence.begin() + move.from);
	sequence.insert(sequence.begin() + move.to, job);
}
