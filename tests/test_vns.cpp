#include "gtest/gtest.h"

#include "Evaluation.h"
#include "FlowShopError.h"
#include "VNS.h"

namespace {

const TimeMatrix kExample = {{5, 3, 8}, {7, 2, 6}, {4, 9, 3}};
const TimeMatrix kSixJobs = {{3, 8, 2, 6}, {7, 1, 9, 4}, {5, 5, 3, 8},
                             {2, 9, 6, 1}, {8, 4, 7, 3}, {6, 2, 5, 9}};

TEST(VNSTest, StopsAfterConsecutiveFailures) {
  Instance instance(kExample);
  FlowShopOptions options;
  options.vns_max_iterations = 3;
  VNS vns(instance, options);
  std::mt19937 rng(1);

  // already optimal: every cycle fails
  ImprovementResult result = vns.improve({0, 2, 1}, rng);
  EXPECT_EQ(Sequence({0, 2, 1}), result.sequence);
  EXPECT_DOUBLE_EQ(27, result.makespan);
  EXPECT_EQ(3, result.iterations);
  EXPECT_EQ(3, vns.num_of_failures);

  // one improving cycle resets the counter
  result = vns.improve({1, 2, 0}, rng);
  EXPECT_DOUBLE_EQ(27, result.makespan);
  EXPECT_EQ(4, result.iterations);
  EXPECT_EQ(3, vns.num_of_consecutive_failures);
}

TEST(VNSTest, ReachesOptimumOnSixJobs) {
  Instance instance(kSixJobs);
  FlowShopOptions options;
  options.vns_max_iterations = 20;
  VNS vns(instance, options);
  std::mt19937 rng(7);
  ImprovementResult result = vns.improve(identitySequence(6), rng);
  EXPECT_TRUE(isPermutation(result.sequence, 6));
  // 47 is the brute-force optimum and plain 2-opt already reaches it
  EXPECT_DOUBLE_EQ(47, result.makespan);
  EXPECT_DOUBLE_EQ(result.makespan, evaluation::makespan(result.sequence, instance));
}

TEST(VNSTest, NeverWorseThanSeed) {
  std::mt19937 gen(21);
  std::uniform_int_distribution<int> time(1, 40);
  TimeMatrix p(10, vector<double>(5));
  for (auto& row : p)
    for (auto& t : row) t = time(gen);
  Instance instance(p);
  Sequence start = identitySequence(10);
  std::shuffle(start.begin(), start.end(), gen);
  double before = evaluation::makespan(start, instance);

  for (int k : {0, 1, 2, 5}) {
    for (int budget : {1, 4}) {
      FlowShopOptions options;
      options.vns_perturbation_size = k;
      options.vns_max_iterations = budget;
      options.max_iterations = 5;
      VNS vns(instance, options);
      std::mt19937 rng(k * 10 + budget);
      ImprovementResult result = vns.improve(start, rng);
      EXPECT_TRUE(isPermutation(result.sequence, 10));
      EXPECT_LE(result.makespan, before);
      EXPECT_LE(result.iterations, budget * 10);
      EXPECT_DOUBLE_EQ(result.makespan, evaluation::makespan(result.sequence, instance));
    }
  }
}

TEST(VNSTest, ImprovementHistoryDecreases) {
  Instance instance(kSixJobs);
  FlowShopOptions options;
  options.vns_max_iterations = 5;
  VNS vns(instance, options);
  std::mt19937 rng(3);
  vns.improve(identitySequence(6), rng);
  ASSERT_FALSE(vns.iteration_stats.empty());
  EXPECT_EQ("start", vns.iteration_stats.front().algorithm);
  double last = MAX_MAKESPAN;
  for (const auto& stats : vns.iteration_stats) {
    EXPECT_LT(stats.makespan, last);
    last = stats.makespan;
  }
}

TEST(VNSTest, Perturb) {
  std::mt19937 rng(5);
  Sequence sequence = identitySequence(9);
  VNS::perturb(sequence, 4, rng);
  EXPECT_TRUE(isPermutation(sequence, 9));
  Sequence single = {0};
  VNS::perturb(single, 3, rng);
  EXPECT_EQ(Sequence({0}), single);
  Sequence unchanged = identitySequence(5);
  VNS::perturb(unchanged, 0, rng);
  EXPECT_EQ(identitySequence(5), unchanged);
}

TEST(VNSTest, RejectsBadConfiguration) {
  Instance instance(kExample);
  FlowShopOptions options;
  options.vns_max_iterations = 0;
  EXPECT_THROW(VNS vns(instance, options), ConfigurationError);
  options.vns_max_iterations = 10;
  options.vns_perturbation_size = -1;
  EXPECT_THROW(VNS vns(instance, options), ConfigurationError);
}

}  // namespace
