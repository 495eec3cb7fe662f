#include "BottleneckSearch.h"
#include "Evaluation.h"
#include "FlowShopError.h"
#include "Logger.h"

namespace
{
void moveJob(Sequence& sequence, int from, int to)
{
	int job = sequence[from];
	sequence.erase(sequence.begin() + from);
	sequence.insert(sequence.begin() + to, job);
}
}


BottleneckSearch::BottleneckSearch(const Instance& instance, int max_iterations, local_search_policy policy,
                                   double time_limit, int screen) :
	LocalSearch(instance, max_iterations, policy, time_limit, screen)
{
	bottleneck = heaviestMachine();
	vector<double> times(instance.num_of_jobs);
	for (int job = 0; job < instance.num_of_jobs; job++)
		times[job] = instance.getProcessingTime(job, bottleneck);
	std::sort(times.begin(), times.end());
	critical_time = times[(int)(0.8 * (times.size() - 1))];
}


ImprovementResult BottleneckSearch::improve(const Sequence& start, std::mt19937& /*rng*/)
{
	evaluation::validateSequence(start, instance, true, getSolverName());
	startClock();
	ImprovementResult result;
	result.sequence = start;
	result.makespan = evaluation::makespan(start, instance);

	Sequence sequence(start);
	TimeMatrix completion = evaluation::completionMatrix(sequence, instance);
	double makespan = result.makespan;
	int num_of_failures = 0;
	bool stalled = sequence.size() < 2;
	while (!stalled && num_of_iteration < max_iterations && !timeout())
	{
		num_of_iteration++;
		string phase = "swap";
		bool improved = intensify(sequence, completion, makespan);
		if (improved)
			num_of_failures = 0;
		else if (++num_of_failures >= 2)
		{
			vector<int> ranked = rankPairs(sequence);
			if (perturb(sequence, completion, makespan, ranked))
			{
				phase = "perturb";
				num_of_failures = 0;
			}
			else if (windowedInsertion(sequence, completion, makespan, ranked))
			{
				phase = "insertion";
				improved = true;
				num_of_failures = 0;
			}
			else
				stalled = true; // the next iteration would repeat this one
		}
		if (improved)
			focusWindow(sequence, completion, makespan);

		if (makespan < result.makespan)
		{
			result.sequence = sequence;
			result.makespan = makespan;
		}
		recordIteration(result.makespan, phase);
	}
	runtime = getTime() - start_time;
	result.iterations = num_of_iteration;
	if (screen >= 1)
	{
		cout << getSolverName() << ": makespan = " << result.makespan << ", iterations = "
		     << num_of_iteration << ", runtime = " << runtime << endl;
	}
	return result;
}


vector<LocalSearch::Move> BottleneckSearch::generateMoves(int num_of_jobs) const
{
	vector<Move> moves;
	for (int i = 0; i + 1 < num_of_jobs; i++)
		moves.emplace_back(i, i + 1);
	return moves;
}


void BottleneckSearch::applyMove(Sequence& sequence, const Move& move) const
{
	std::swap(sequence[move.from], sequence[move.to]);
}


int BottleneckSearch::heaviestMachine() const
{
	int heaviest = 0;
	for (int machine = 1; machine < instance.num_of_machines; machine++)
	{
		if (instance.getMachineLoad(machine) > instance.getMachineLoad(heaviest))
			heaviest = machine;
	}
	return heaviest;
}


double BottleneckSearch::scorePair(const Sequence& sequence, int pos) const
{
	int n = (int)sequence.size();
	if (pos < 0 || pos + 1 >= n)
	{
		throw DimensionError(getSolverName(), "pair position " + std::to_string(pos) +
		                     " out of range for " + std::to_string(n) + " jobs");
	}
	const vector<double>& totals = instance.getTotalProcessingTimes();
	int first = sequence[pos];
	int second = sequence[pos + 1];
	double score = std::abs(instance.getProcessingTime(first, bottleneck) - instance.getProcessingTime(second, bottleneck))
	               + std::abs(totals[first] - totals[second]);

	// pendulum bias: the heavier job toward the center, the lighter toward an end
	double center = (n - 1) / 2.0;
	int heavy = totals[first] >= totals[second] ? pos : pos + 1;
	int light = 2 * pos + 1 - heavy;
	auto endDistance = [n](int p) { return min(p, n - 1 - p); };
	double centrality = max(0.0, std::abs(heavy - center) - std::abs(light - center));
	double end_bias = max(0, endDistance(heavy) - endDistance(light));
	score += 9 * centrality + 4 * end_bias;

	// load roughness of the neighboring pairs
	auto swapped = [&](int k) { return k == pos ? second : (k == pos + 1 ? first : sequence[k]); };
	double rough_before = 0, rough_after = 0;
	for (int k = max(0, pos - 1); k <= min(pos + 1, n - 2); k++)
	{
		rough_before += std::abs(totals[sequence[k]] - totals[sequence[k + 1]]);
		rough_after += std::abs(totals[swapped(k)] - totals[swapped(k + 1)]);
	}
	score += 1.5 * max(0.0, rough_before - rough_after);

	if (instance.getProcessingTime(first, bottleneck) >= critical_time ||
	    instance.getProcessingTime(second, bottleneck) >= critical_time)
		score += 5;
	return score;
}


vector<int> BottleneckSearch::rankPairs(const Sequence& sequence) const
{
	int num_pairs = max(0, (int)sequence.size() - 1);
	vector<double> scores(num_pairs);
	for (int pos = 0; pos < num_pairs; pos++)
		scores[pos] = scorePair(sequence, pos);
	vector<int> ranked = identitySequence(num_pairs);
	std::stable_sort(ranked.begin(), ranked.end(), [&](int a, int b) { return scores[a] > scores[b]; });
	return ranked;
}


double BottleneckSearch::swapMakespan(const Sequence& sequence, const TimeMatrix& completion, int pos) const
{
	Sequence candidate(sequence);
	std::swap(candidate[pos], candidate[pos + 1]);
	return evaluation::makespanFrom(candidate, completion, pos, instance);
}


void BottleneckSearch::commitSwap(Sequence& sequence, TimeMatrix& completion, int pos) const
{
	std::swap(sequence[pos], sequence[pos + 1]);
	evaluation::updateCompletion(sequence, completion, pos, instance);
}


bool BottleneckSearch::intensify(Sequence& sequence, TimeMatrix& completion, double& makespan) const
{
	bool improved = false;
	while (!timeout())
	{
		int best_pos = -1;
		double best_makespan = makespan;
		for (int pos : rankPairs(sequence))
		{
			double cmax = swapMakespan(sequence, completion, pos);
			if (cmax < best_makespan)
			{
				best_pos = pos;
				best_makespan = cmax;
				if (policy == FIRST_IMPROVEMENT)
					break;
			}
		}
		if (best_pos < 0)
			break;
		commitSwap(sequence, completion, best_pos);
		makespan = best_makespan;
		improved = true;
	}
	return improved;
}


bool BottleneckSearch::perturb(Sequence& sequence, TimeMatrix& completion, double& makespan,
                               const vector<int>& ranked) const
{
	int pos = ranked.front();
	double cmax = swapMakespan(sequence, completion, pos);
	if (cmax > makespan + MAX_WORSENING * makespan)
		return false;
	if (screen >= 2)
		cout << getSolverName() << " perturbs pair " << pos << ": " << makespan << " -> " << cmax << endl;
	commitSwap(sequence, completion, pos);
	makespan = cmax;
	return true;
}


bool BottleneckSearch::windowedInsertion(Sequence& sequence, TimeMatrix& completion, double& makespan,
                                         const vector<int>& ranked) const
{
	int n = (int)sequence.size();
	int num_candidates = min(INSERTION_CANDIDATES, (int)ranked.size());
	Sequence candidate;
	for (int c = 0; c < num_candidates && !timeout(); c++)
	{
		int from = ranked[c];
		int right = min(n - 1, from + INSERTION_WINDOW);
		for (int to = max(0, from - INSERTION_WINDOW); to <= right; to++)
		{
			if (to == from)
				continue;
			candidate = sequence;
			moveJob(candidate, from, to);
			int first = min(from, to);
			double cmax = evaluation::makespanFrom(candidate, completion, first, instance);
			if (cmax < makespan)
			{
				sequence.swap(candidate);
				evaluation::updateCompletion(sequence, completion, first, instance);
				makespan = cmax;
				return true;
			}
		}
	}
	return false;
}


bool BottleneckSearch::focusWindow(Sequence& sequence, TimeMatrix& completion, double& makespan) const
{
	int focus = rankPairs(sequence).front();
	int left = max(0, focus - FOCUS_WINDOW);
	int right = min((int)sequence.size() - 2, focus + FOCUS_WINDOW);
	bool improved = false;
	bool swept = true;
	while (swept && !timeout())
	{
		swept = false;
		for (int pos = left; pos <= right; pos++)
		{
			double cmax = swapMakespan(sequence, completion, pos);
			if (cmax < makespan)
			{
				commitSwap(sequence, completion, pos);
				makespan = cmax;
				swept = improved = true;
			}
		}
	}
	return improved;
}
