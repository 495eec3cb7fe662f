#include "gtest/gtest.h"

#include "Evaluation.h"
#include "FlowShopError.h"
#include "LocalSearch.h"

namespace {

const TimeMatrix kExample = {{5, 3, 8}, {7, 2, 6}, {4, 9, 3}};
const TimeMatrix kSixJobs = {{3, 8, 2, 6}, {7, 1, 9, 4}, {5, 5, 3, 8},
                             {2, 9, 6, 1}, {8, 4, 7, 3}, {6, 2, 5, 9}};

TEST(LocalSearchTest, Neighborhoods) {
  Instance instance(kExample);
  TwoOptSearch two_opt(instance, 10, BEST_IMPROVEMENT, 60, 0);
  InsertionSearch insertion(instance, 10, BEST_IMPROVEMENT, 60, 0);
  EXPECT_EQ(6u, two_opt.generateMoves(4).size());
  EXPECT_EQ(12u, insertion.generateMoves(4).size());
  EXPECT_TRUE(two_opt.generateMoves(1).empty());

  Sequence sequence = {0, 1, 2, 3, 4};
  two_opt.applyMove(sequence, LocalSearch::Move(1, 3));
  EXPECT_EQ(Sequence({0, 3, 2, 1, 4}), sequence);
  sequence = {0, 1, 2, 3, 4};
  insertion.applyMove(sequence, LocalSearch::Move(1, 3));
  EXPECT_EQ(Sequence({0, 2, 3, 1, 4}), sequence);
  insertion.applyMove(sequence, LocalSearch::Move(4, 0));
  EXPECT_EQ(Sequence({4, 0, 2, 3, 1}), sequence);
}

TEST(LocalSearchTest, TwoOptBestImprovement) {
  Instance instance(kExample);
  TwoOptSearch search(instance, 1000, BEST_IMPROVEMENT, 60, 0);
  std::mt19937 rng(0);
  ImprovementResult result = search.improve({0, 1, 2}, rng);
  EXPECT_EQ(Sequence({0, 2, 1}), result.sequence);
  EXPECT_DOUBLE_EQ(27, result.makespan);
  EXPECT_EQ(2, result.iterations);

  // 2-opt local optimum that insertion can still leave
  result = search.improve({1, 0, 2}, rng);
  EXPECT_EQ(Sequence({1, 0, 2}), result.sequence);
  EXPECT_DOUBLE_EQ(28, result.makespan);
  EXPECT_EQ(1, result.iterations);
}

TEST(LocalSearchTest, InsertionBestImprovement) {
  Instance instance(kExample);
  InsertionSearch search(instance, 1000, BEST_IMPROVEMENT, 60, 0);
  std::mt19937 rng(0);
  ImprovementResult result = search.improve({1, 0, 2}, rng);
  EXPECT_EQ(Sequence({0, 2, 1}), result.sequence);
  EXPECT_DOUBLE_EQ(27, result.makespan);
  EXPECT_EQ(2, result.iterations);
}

TEST(LocalSearchTest, SixJobs) {
  Instance instance(kSixJobs);
  std::mt19937 rng(0);
  Sequence start = identitySequence(6);
  EXPECT_DOUBLE_EQ(56, evaluation::makespan(start, instance));

  ImprovementResult result = TwoOptSearch(instance, 1000, BEST_IMPROVEMENT, 60, 0).improve(start, rng);
  EXPECT_EQ(Sequence({0, 4, 2, 5, 1, 3}), result.sequence);
  EXPECT_DOUBLE_EQ(47, result.makespan);
  EXPECT_EQ(3, result.iterations);

  result = InsertionSearch(instance, 1000, BEST_IMPROVEMENT, 60, 0).improve(start, rng);
  EXPECT_EQ(Sequence({0, 1, 2, 5, 3, 4}), result.sequence);
  EXPECT_DOUBLE_EQ(48, result.makespan);
  EXPECT_EQ(2, result.iterations);
}

TEST(LocalSearchTest, FirstImprovement) {
  Instance instance(kSixJobs);
  std::mt19937 rng(0);
  Sequence start = identitySequence(6);
  TwoOptSearch two_opt(instance, 1000, FIRST_IMPROVEMENT, 60, 0);
  ImprovementResult result = two_opt.improve(start, rng);
  EXPECT_EQ(Sequence({2, 1, 5, 0, 4, 3}), result.sequence);
  EXPECT_DOUBLE_EQ(49, result.makespan);
  EXPECT_EQ(4, result.iterations);

  InsertionSearch insertion(instance, 1000, FIRST_IMPROVEMENT, 60, 0);
  result = insertion.improve(start, rng);
  EXPECT_EQ(Sequence({2, 4, 0, 5, 1, 3}), result.sequence);
  EXPECT_DOUBLE_EQ(48, result.makespan);
  EXPECT_EQ(6, result.iterations);

  Instance example(kExample);
  result = TwoOptSearch(example, 1000, FIRST_IMPROVEMENT, 60, 0).improve({1, 2, 0}, rng);
  EXPECT_DOUBLE_EQ(27, result.makespan);
  EXPECT_EQ(4, result.iterations);
}

TEST(LocalSearchTest, IterationBudget) {
  Instance instance(kSixJobs);
  std::mt19937 rng(0);
  TwoOptSearch search(instance, 1, BEST_IMPROVEMENT, 60, 0);
  ImprovementResult result = search.improve(identitySequence(6), rng);
  EXPECT_EQ(1, result.iterations);
  EXPECT_LT(result.makespan, 56);
  EXPECT_GT(result.makespan, 47);
  EXPECT_EQ(1u, search.iteration_stats.size());

  EXPECT_THROW(TwoOptSearch(instance, 0, BEST_IMPROVEMENT, 60, 0), ConfigurationError);
}

TEST(LocalSearchTest, NeverWorsens) {
  std::mt19937 gen(3);
  std::uniform_int_distribution<int> time(1, 25);
  for (int trial = 0; trial < 10; trial++) {
    TimeMatrix p(8, vector<double>(4));
    for (auto& row : p)
      for (auto& t : row) t = time(gen);
    Instance instance(p);
    Sequence start = identitySequence(8);
    std::shuffle(start.begin(), start.end(), gen);
    double before = evaluation::makespan(start, instance);
    for (auto policy : {BEST_IMPROVEMENT, FIRST_IMPROVEMENT}) {
      ImprovementResult a = TwoOptSearch(instance, 1000, policy, 60, 0).improve(start, gen);
      ImprovementResult b = InsertionSearch(instance, 1000, policy, 60, 0).improve(start, gen);
      EXPECT_TRUE(isPermutation(a.sequence, 8));
      EXPECT_TRUE(isPermutation(b.sequence, 8));
      EXPECT_LE(a.makespan, before);
      EXPECT_LE(b.makespan, before);
      EXPECT_DOUBLE_EQ(a.makespan, evaluation::makespan(a.sequence, instance));
      EXPECT_DOUBLE_EQ(b.makespan, evaluation::makespan(b.sequence, instance));
    }
  }
}

TEST(LocalSearchTest, RejectsInvalidStart) {
  Instance instance(kExample);
  std::mt19937 rng(0);
  TwoOptSearch search(instance, 10, BEST_IMPROVEMENT, 60, 0);
  EXPECT_THROW(search.improve({0, 0, 1}, rng), DimensionError);
  EXPECT_THROW(search.improve({0, 1}, rng), DimensionError);
}

}  // namespace
