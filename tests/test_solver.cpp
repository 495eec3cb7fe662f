#include "gtest/gtest.h"

#include "Evaluation.h"
#include "FlowShopError.h"
#include "FlowShopSolver.h"

namespace {

const TimeMatrix kExample = {{5, 3, 8}, {7, 2, 6}, {4, 9, 3}};

FlowShopOptions fastOptions() {
  FlowShopOptions options;
  options.seed = 12;
  options.vns_max_iterations = 5;
  options.ga_population_size = 10;
  options.ga_elite_size = 2;
  options.ga_generations = 5;
  return options;
}

TEST(ResultTableTest, SortedAndBest) {
  ResultTable table;
  EXPECT_TRUE(table.empty());
  EXPECT_THROW(table.best(), FlowShopError);
  table.add(MethodResult("A", {0, 1}, 30, 0.1));
  table.add(MethodResult("B", {1, 0}, 20, 0.1));
  table.add(MethodResult("C", {0, 1}, 30, 0.1));
  table.add(MethodResult("D", {1, 0}, 20, 0.1));
  EXPECT_EQ(4u, table.size());
  EXPECT_EQ("B", table.best().method);
  vector<MethodResult> sorted = table.sorted();
  vector<string> names;
  for (const auto& r : sorted) names.push_back(r.method);
  EXPECT_EQ(vector<string>({"B", "D", "A", "C"}), names);
}

TEST(FlowShopSolverTest, ComparesHeuristicsOnExample) {
  Instance instance(kExample);
  FlowShopSolver solver(instance, fastOptions());
  const MethodResult& best = solver.run({NEH, PALMER, CDS, JOHNSON, SPT, LPT, PENDULUM}, {});
  // Johnson does not apply to three machines and is skipped
  EXPECT_EQ(6u, solver.results.size());
  EXPECT_EQ("NEH", best.method);
  EXPECT_EQ(Sequence({0, 2, 1}), best.sequence);
  EXPECT_DOUBLE_EQ(27, best.makespan);
  for (const auto& r : solver.results.getResults()) {
    EXPECT_NE("Johnson", r.method);
    EXPECT_TRUE(isPermutation(r.sequence, 3));
    EXPECT_DOUBLE_EQ(evaluation::makespan(r.sequence, instance), r.makespan);
  }
  EXPECT_NO_THROW(solver.validateSolution());
}

TEST(FlowShopSolverTest, ChainsImprovementsFromBest) {
  Instance instance(kExample);
  FlowShopSolver solver(instance, fastOptions());
  solver.run({PALMER}, {TWO_OPT, INSERTION});
  ASSERT_EQ(3u, solver.results.size());
  const auto& results = solver.results.getResults();
  EXPECT_EQ("Palmer", results[0].method);
  EXPECT_DOUBLE_EQ(28, results[0].makespan);
  EXPECT_EQ("Palmer+2opt", results[1].method);
  EXPECT_DOUBLE_EQ(27, results[1].makespan);
  // insertion starts from the improved 2-opt sequence
  EXPECT_EQ("Palmer+2opt+Insertion", results[2].method);
  EXPECT_DOUBLE_EQ(27, results[2].makespan);
  EXPECT_EQ("Palmer+2opt", solver.results.best().method);
  EXPECT_EQ("FlowShop(Palmer;2opt;Insertion)", solver.getSolverName());
}

TEST(FlowShopSolverTest, FullPipeline) {
  Instance instance(TimeMatrix{{3, 8, 2, 6}, {7, 1, 9, 4}, {5, 5, 3, 8}, {2, 9, 6, 1}, {8, 4, 7, 3}, {6, 2, 5, 9}});
  FlowShopSolver solver(instance, fastOptions());
  const MethodResult& best =
      solver.run({NEH, PALMER, CDS, SPT, LPT, PENDULUM, RANDOM}, {TWO_OPT, INSERTION, VNS_SEARCH, GENETIC}, true);
  EXPECT_EQ(12u, solver.results.size());
  // 47 is optimal, NEH alone gives 49
  EXPECT_GE(best.makespan, 47);
  EXPECT_LE(best.makespan, 49);
  EXPECT_NO_THROW(solver.validateSolution());
  bool found_standalone = false;
  for (const auto& r : solver.results.getResults())
    found_standalone |= (r.method == "GA(standalone)");
  EXPECT_TRUE(found_standalone);
  testing::internal::CaptureStdout();
  solver.printResult();
  string output = testing::internal::GetCapturedStdout();
  stringstream expected;
  expected << std::fixed << std::setprecision(3) << "final makespan " << best.makespan << " method " << best.method;
  EXPECT_NE(string::npos, output.find(expected.str()));
  EXPECT_NE(string::npos, output.find("(bottleneck)"));
}

TEST(FlowShopSolverTest, NEHThenTwoOpt) {
  Instance instance(TimeMatrix{{3, 8, 2, 6}, {7, 1, 9, 4}, {5, 5, 3, 8}, {2, 9, 6, 1}, {8, 4, 7, 3}, {6, 2, 5, 9}});
  FlowShopSolver solver(instance, fastOptions());
  const MethodResult& best = solver.run({NEH, CDS}, {TWO_OPT});
  EXPECT_EQ("NEH+2opt", best.method);
  EXPECT_EQ(Sequence({0, 4, 2, 5, 1, 3}), best.sequence);
  EXPECT_DOUBLE_EQ(47, best.makespan);
}

TEST(FlowShopSolverTest, SameSeedSameResult) {
  Instance instance(TimeMatrix{{3, 8, 2, 6}, {7, 1, 9, 4}, {5, 5, 3, 8}, {2, 9, 6, 1}, {8, 4, 7, 3}, {6, 2, 5, 9}});
  FlowShopSolver a(instance, fastOptions());
  FlowShopSolver b(instance, fastOptions());
  Sequence first = a.run({RANDOM}, {GENETIC}).sequence;
  Sequence second = b.run({RANDOM}, {GENETIC}).sequence;
  EXPECT_EQ(first, second);
}

TEST(FlowShopSolverTest, ConfigurationErrors) {
  Instance instance(kExample);
  FlowShopSolver solver(instance, fastOptions());
  EXPECT_THROW(solver.run({}, {TWO_OPT}), ConfigurationError);
  EXPECT_THROW(solver.run({JOHNSON}, {TWO_OPT}), ConfigurationError);

  FlowShopOptions options = fastOptions();
  options.max_iterations = 0;
  EXPECT_THROW(FlowShopSolver bad(instance, options), ConfigurationError);

  EXPECT_THROW(parseImprovementName("tabu"), ConfigurationError);
  EXPECT_EQ(TWO_OPT, parseImprovementName("2-opt"));
  EXPECT_EQ(VNS_SEARCH, parseImprovementName("vns"));
  EXPECT_EQ(FIRST_IMPROVEMENT, parsePolicy("first"));
  EXPECT_THROW(parsePolicy("worst"), ConfigurationError);
}

TEST(FlowShopSolverTest, JohnsonOnTwoMachines) {
  Instance instance(TimeMatrix{{3, 4}, {6, 2}, {5, 5}, {2, 7}});
  FlowShopSolver solver(instance, fastOptions());
  const MethodResult& best = solver.run({JOHNSON}, {});
  EXPECT_EQ("Johnson", best.method);
  EXPECT_EQ(Sequence({3, 0, 2, 1}), best.sequence);
}

}  // namespace
