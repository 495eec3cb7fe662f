#include <boost/program_options.hpp>
#include <boost/tokenizer.hpp>

#include "FlowShopError.h"
#include "FlowShopSolver.h"
#include "Logger.h"
#include "defines.h"

// #define PROFILE      // needs the profiler library in cmake (FLOWSHOP_PROFILE)

#ifdef PROFILE
#include <gperftools/profiler.h>
#endif

vector<string> splitNames(const string& list) {
    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    boost::char_separator<char> sep(", ");
    tokenizer tok(list, sep);
    return vector<string>(tok.begin(), tok.end());
}

/* Main function */
int main(int argc, char **argv) {
    namespace po = boost::program_options;
    // Declare the supported options.
    po::options_description desc("Allowed options");
    desc.add_options()("help", "produce help message")
        // params for the input instance
        ("instance,i", po::value<string>()->required(),
            "input file of processing times (.txt/.fsp Taillard format, otherwise a csv table)")
        ("cutoffTime,t", po::value<double>()->default_value(7200), "cutoff time of each search stage (seconds)")
        ("screen,s", po::value<int>()->default_value(0),
            "screen option (0: none; 1: results; 2: all)")
        ("seed", po::value<int>()->default_value(0), "Random seed (negative: from the clock)")

        // methods
        ("heuristics", po::value<string>()->default_value("NEH,Palmer,CDS,Johnson,SPT,LPT,Pendulum"),
            "constructive heuristics (NEH, Palmer, CDS, Johnson, SPT, LPT, Pendulum, Random)")
        ("improvements", po::value<string>()->default_value("2opt,Insertion,Bottleneck,VNS,GA"),
            "improvement stages, applied in order to the best sequence so far (2opt, Insertion, Bottleneck, VNS, GA)")
        ("standaloneGA", po::value<bool>()->default_value(false),
            "also run the GA from a random population")

        // params for local search
        ("maxIterations", po::value<int>()->default_value(1000),
            "maximum number of scans of 2opt and Insertion, iterations of Bottleneck")
        ("policy", po::value<string>()->default_value("best"),
            "local search acceptance (best, first)")

        // params for vns
        ("vnsMaxIterations", po::value<int>()->default_value(100),
            "consecutive non-improving VNS cycles before stopping")
        ("vnsPerturbationSize", po::value<int>()->default_value(2), "random swaps per VNS perturbation")

        // params for the genetic algorithm
        ("gaPopulationSize", po::value<int>()->default_value(50), "GA population size")
        ("gaMutationRate", po::value<double>()->default_value(0.1), "GA swap mutation probability")
        ("gaCrossoverRate", po::value<double>()->default_value(0.8), "GA order crossover probability")
        ("gaEliteSize", po::value<int>()->default_value(5), "individuals kept unchanged per generation")
        ("gaGenerations", po::value<int>()->default_value(-1),
            "GA generations (-1: 50 when seeded, 100 standalone)")
        ("gaTournamentSize", po::value<int>()->default_value(3), "GA tournament size")
        ;
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            cout << desc << endl;
            return 1;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        cerr << e.what() << endl << desc << endl;
        return 1;
    }

    FlowShopOptions options;
    options.max_iterations = vm["maxIterations"].as<int>();
    options.vns_max_iterations = vm["vnsMaxIterations"].as<int>();
    options.vns_perturbation_size = vm["vnsPerturbationSize"].as<int>();
    options.ga_population_size = vm["gaPopulationSize"].as<int>();
    options.ga_mutation_rate = vm["gaMutationRate"].as<double>();
    options.ga_crossover_rate = vm["gaCrossoverRate"].as<double>();
    options.ga_elite_size = vm["gaEliteSize"].as<int>();
    options.ga_generations = vm["gaGenerations"].as<int>();
    options.ga_tournament_size = vm["gaTournamentSize"].as<int>();
    options.seed = vm["seed"].as<int>();
    options.time_limit = vm["cutoffTime"].as<double>();
    options.screen = vm["screen"].as<int>();
    setVerbosityLevel(options.screen);

    try {
        options.policy = parsePolicy(vm["policy"].as<string>());
        options.validate();

        vector<heuristic_type> heuristics;
        for (const auto& name : splitNames(vm["heuristics"].as<string>()))
            heuristics.push_back(parseHeuristicName(name));
        vector<improvement_type> improvements;
        for (const auto& name : splitNames(vm["improvements"].as<string>()))
            improvements.push_back(parseImprovementName(name));

        Instance instance(vm["instance"].as<string>());
        log(0, "Instance %s (%d jobs x %d machines) loaded in %.2f seconds.\n",
            instance.getInstanceName().c_str(), instance.num_of_jobs, instance.num_of_machines, getTime());
        if (options.screen >= 2)
            instance.printInstance();

        FlowShopSolver solver(instance, options);
        log(1, "Random seed %u, local search policy %s.\n", solver.getSeed(),
            policyName(options.policy).c_str());
#ifdef PROFILE
        ProfilerStart("cpu_profile.log");
#endif
        solver.run(heuristics, improvements, vm["standaloneGA"].as<bool>());
#ifdef PROFILE
        ProfilerStop();
#endif
        solver.validateSolution();
        log(0, "%s finished.\n", solver.getSolverName().c_str());
        solver.printResult();
    } catch (const FlowShopError& e) {
        exitError("%s\n", e.what());
    }
    return 0;
}
