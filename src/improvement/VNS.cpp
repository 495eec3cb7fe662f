#include "VNS.h"
#include "Evaluation.h"
#include "Logger.h"

VNS::VNS(const Instance& instance, const FlowShopOptions& options) :
	ImprovementOperator(instance, options.time_limit, options.screen),
	max_iterations(options.vns_max_iterations), perturbation_size(options.vns_perturbation_size),
	two_opt(instance, options.max_iterations, options.policy, options.time_limit, max(options.screen - 1, 0)),
	insertion(instance, options.max_iterations, options.policy, options.time_limit, max(options.screen - 1, 0))
{
	options.validate();
}


void VNS::perturb(Sequence& sequence, int k, std::mt19937& rng)
{
	if (sequence.size() < 2)
		return;
	std::uniform_int_distribution<int> position(0, (int)sequence.size() - 1);
	for (int i = 0; i < k; i++)
	{
		int a = position(rng);
		int b = position(rng);
		std::swap(sequence[a], sequence[b]);
	}
}


void VNS::runLocalSearch(LocalSearch& search, Sequence& sequence, double& makespan, std::mt19937& rng)
{
	search.setTimeLimit(max(time_limit - (getTime() - start_time), 1e-6));
	ImprovementResult result = search.improve(sequence, rng);
	sequence = result.sequence;
	makespan = result.makespan;
}


ImprovementResult VNS::improve(const Sequence& start, std::mt19937& rng)
{
	evaluation::validateSequence(start, instance, true, getSolverName());
	startClock();
	num_of_failures = 0;
	num_of_consecutive_failures = 0;

	ImprovementResult best;
	best.sequence = start;
	best.makespan = evaluation::makespan(start, instance);
	recordIteration(best.makespan, "start");

	Sequence current = start;
	double current_makespan = best.makespan;
	int max_cycles = max_iterations * 10;
	vns_state state = EXPLOIT_TWO_OPT;
	while (state != DONE)
	{
		switch (state)
		{
			case EXPLOIT_TWO_OPT:
				runLocalSearch(two_opt, current, current_makespan, rng);
				state = EXPLOIT_INSERTION;
				break;
			case EXPLOIT_INSERTION:
				runLocalSearch(insertion, current, current_makespan, rng);
				num_of_iteration++;
				if (current_makespan < best.makespan)
				{
					best.sequence = current;
					best.makespan = current_makespan;
					num_of_consecutive_failures = 0;
					recordIteration(best.makespan, "improve");
					state = EXPLOIT_TWO_OPT;
				}
				else
				{
					num_of_failures++;
					num_of_consecutive_failures++;
					state = PERTURB;
				}
				if (num_of_consecutive_failures >= max_iterations || num_of_iteration >= max_cycles || timeout())
					state = DONE;
				break;
			case PERTURB:
				current = best.sequence;
				perturb(current, perturbation_size, rng);
				current_makespan = evaluation::makespan(current, instance);
				state = EXPLOIT_TWO_OPT;
				break;
			case DONE:
				break;
		}
	}

	runtime = getTime() - start_time;
	best.iterations = num_of_iteration;
	if (screen >= 1)
	{
		cout << getSolverName() << ": makespan = " << best.makespan << ", cycles = " << num_of_iteration
		     << ", failures = " << num_of_failures << ", runtime = " << runtime << endl;
	}
	return best;
}
