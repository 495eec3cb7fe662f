#include "GeneticAlgorithm.h"
#include "Evaluation.h"
#include "FlowShopError.h"
#include "Logger.h"

void Individual::setSequence(const Sequence& new_sequence)
{
	sequence = new_sequence;
	evaluated = false;
}


void Individual::swapPositions(int a, int b)
{
	std::swap(sequence[a], sequence[b]);
	evaluated = false;
}


void Individual::evaluate(const Instance& instance)
{
	makespan = evaluation::makespan(sequence, instance);
	evaluated = true;
}


double Individual::getMakespan() const
{
	if (!evaluated)
		throw FlowShopError("Individual", "makespan requested before evaluation");
	return makespan;
}


double Individual::getFitness() const
{
	return 1.0 / (1.0 + getMakespan());
}


GeneticAlgorithm::GeneticAlgorithm(const Instance& instance, const FlowShopOptions& options) :
	ImprovementOperator(instance, options.time_limit, options.screen),
	population_size(options.ga_population_size), elite_size(options.ga_elite_size),
	crossover_rate(options.ga_crossover_rate), mutation_rate(options.ga_mutation_rate),
	tournament_size(options.ga_tournament_size), seeded_generations(options.getGenerations(true)),
	standalone_generations(options.getGenerations(false))
{
	options.validate();
}


ImprovementResult GeneticAlgorithm::improve(const Sequence& start, std::mt19937& rng)
{
	evaluation::validateSequence(start, instance, true, getSolverName());
	return run(&start, seeded_generations, rng);
}


ImprovementResult GeneticAlgorithm::runStandalone(std::mt19937& rng)
{
	return run(nullptr, standalone_generations, rng);
}


Sequence GeneticAlgorithm::orderCrossover(const Sequence& a, const Sequence& b, int cut1, int cut2)
{
	int n = (int)a.size();
	if ((int)b.size() != n || cut1 < 0 || cut2 >= n || cut1 > cut2)
		throw DimensionError("GA", "invalid crossover parents or cut points");

	Sequence child(n, -1);
	vector<char> used(n, 0);
	for (int i = cut1; i <= cut2; i++)
	{
		child[i] = a[i];
		used[a[i]] = 1;
	}
	int pos = (cut2 + 1) % n;
	for (int k = 0; k < n; k++)
	{
		int job = b[(cut2 + 1 + k) % n];
		if (used[job])
			continue;
		child[pos] = job;
		used[job] = 1;
		pos = (pos + 1) % n;
	}
	return child;
}


int GeneticAlgorithm::tournamentSelect(const Population& population, int tournament_size,
                                       std::mt19937& rng)
{
	std::uniform_int_distribution<int> pick(0, (int)population.size() - 1);
	int winner = pick(rng);
	for (int i = 1; i < tournament_size; i++)
	{
		int contender = pick(rng);
		if (population[contender].getMakespan() < population[winner].getMakespan())
			winner = contender;
	}
	return winner;
}


void GeneticAlgorithm::initPopulation(Population& population, const Sequence* seed,
                                      std::mt19937& rng) const
{
	population.clear();
	population.reserve(population_size);
	if (seed != nullptr)
		population.emplace_back(*seed);
	Sequence sequence = identitySequence(instance.num_of_jobs);
	while ((int)population.size() < population_size)
	{
		std::shuffle(sequence.begin(), sequence.end(), rng);
		population.emplace_back(sequence);
	}
}


void GeneticAlgorithm::evaluatePopulation(Population& population) const
{
	int size = (int)population.size();
	#pragma omp parallel for if (size > 16)
	for (int i = 0; i < size; i++)
	{
		if (!population[i].isEvaluated())
			population[i].evaluate(instance);
	}
}


void GeneticAlgorithm::mutate(Individual& individual, std::mt19937& rng) const
{
	std::uniform_real_distribution<double> coin(0.0, 1.0);
	if (coin(rng) >= mutation_rate)
		return;
	std::uniform_int_distribution<int> position(0, instance.num_of_jobs - 1);
	int a = position(rng);
	int b = position(rng);
	individual.swapPositions(a, b);
}


ImprovementResult GeneticAlgorithm::run(const Sequence* seed, int generations, std::mt19937& rng)
{
	startClock();
	best_history.clear();

	Population population;
	initPopulation(population, seed, rng);
	evaluatePopulation(population);

	auto by_makespan = [](const Individual& x, const Individual& y) {
		return x.getMakespan() < y.getMakespan();
	};
	std::stable_sort(population.begin(), population.end(), by_makespan);
	Individual best = population[0];
	recordIteration(best.getMakespan(), "init");

	int n = instance.num_of_jobs;
	std::uniform_real_distribution<double> coin(0.0, 1.0);
	std::uniform_int_distribution<int> cut(0, n - 1);
	for (int generation = 0; generation < generations && !timeout(); generation++)
	{
		Population next(population.begin(), population.begin() + elite_size);
		while ((int)next.size() < population_size)
		{
			const Individual& parent1 = population[tournamentSelect(population, tournament_size, rng)];
			const Individual& parent2 = population[tournamentSelect(population, tournament_size, rng)];
			Individual child1(parent1.getSequence());
			Individual child2(parent2.getSequence());
			if (coin(rng) < crossover_rate)
			{
				int cut1 = cut(rng);
				int cut2 = cut(rng);
				if (cut1 > cut2)
					std::swap(cut1, cut2);
				child1.setSequence(orderCrossover(parent1.getSequence(), parent2.getSequence(), cut1, cut2));
				child2.setSequence(orderCrossover(parent2.getSequence(), parent1.getSequence(), cut1, cut2));
			}
			mutate(child1, rng);
			mutate(child2, rng);
			next.push_back(child1);
			if ((int)next.size() < population_size)
				next.push_back(child2);
		}
		evaluatePopulation(next);
		std::stable_sort(next.begin(), next.end(), by_makespan);
		population.swap(next);

		if (population[0].getMakespan() < best.getMakespan())
			best = population[0];
		best_history.push_back(best.getMakespan());
		num_of_iteration++;
		recordIteration(best.getMakespan(), "generation");
	}

	runtime = getTime() - start_time;
	if (screen >= 1)
	{
		cout << getSolverName() << (seed == nullptr ? "(standalone)" : "") << ": makespan = "
		     << best.getMakespan() << ", generations = " << num_of_iteration << ", runtime = "
		     << runtime << endl;
	}
	ImprovementResult result;
	result.sequence = best.getSequence();
	result.makespan = best.getMakespan();
	result.iterations = num_of_iteration;
	return result;
}
