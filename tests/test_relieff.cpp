#include <catch2/catch.hpp>

#include <vector>

#include "Dataset.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "ReliefF.h"
#include "ReliefFunctions.h"
#include "TestData.h"

using namespace std;

TEST_CASE("ReliefF ranks the interacting features first", "[relieff]") {
  WeightUpdateMode modes[] = { K_NEAREST_UPDATE, DIFF_UPDATE, EXP_RANK_UPDATE };
  FeatureType types[] = { CONTINUOUS_FEATURES, DISCRETE_FEATURES };
  for(unsigned int t = 0; t < 2; ++t) {
    for(unsigned int p = 0; p < NUM_TEST_PAIRS; ++p) {
      unsigned int a = TEST_PAIRS[p][0];
      unsigned int b = TEST_PAIRS[p][1];
      FeatureMatrix data;
      ClassVector target;
      MakeComparisonData(200, 10, types[t], a, b, 11 + p, data, target);
      for(unsigned int i = 0; i < 3; ++i) {
        INFO("type " << FeatureTypeName(types[t]) << ", mode "
             << WeightUpdateModeName(modes[i]) << ", features " << a
             << " and " << b);
        WeightVector weights = relieff(data, target, types[t], modes[i]);
        REQUIRE(weights.size() == 10);
        REQUIRE(RelevantFeaturesLead(weights, a, b));
      }
    }
  }
}

TEST_CASE("ReliefF exp_rank on a larger continuous data set", "[relieff]") {
  FeatureMatrix data;
  ClassVector target;
  MakeComparisonData(1000, 10, CONTINUOUS_FEATURES, 0, 1, 3, data, target);
  WeightVector weights = relieff(data, target, CONTINUOUS_FEATURES,
                                 EXP_RANK_UPDATE);
  for(unsigned int j = 2; j < 10; ++j) {
    REQUIRE(weights[0] > weights[j]);
    REQUIRE(weights[1] > weights[j]);
  }
}

TEST_CASE("ReliefF weights are reproducible", "[relieff]") {
  FeatureMatrix data;
  ClassVector target;
  MakeComparisonData(120, 6, CONTINUOUS_FEATURES, 0, 1, 5, data, target);

  SECTION("all instances") {
    WeightVector first = relieff(data, target, CONTINUOUS_FEATURES, DIFF_UPDATE);
    WeightVector second = relieff(data, target, CONTINUOUS_FEATURES, DIFF_UPDATE);
    REQUIRE(first == second);
  }
  SECTION("random samples with a fixed seed") {
    Dataset ds;
    ds.LoadDataset(data, target, CONTINUOUS_FEATURES);
    ReliefF first(&ds, K_NEAREST_UPDATE, 5, DEFAULT_EXP_RANK_SIGMA, 40, 7);
    ReliefF second(&ds, K_NEAREST_UPDATE, 5, DEFAULT_EXP_RANK_SIGMA, 40, 7);
    REQUIRE(first.GetNumSamples() == 40);
    first.ComputeAttributeScores();
    second.ComputeAttributeScores();
    REQUIRE(first.GetWeights() == second.GetWeights());
    // a second run of the same object repeats the samples
    WeightVector before = first.GetWeights();
    first.ComputeAttributeScores();
    REQUIRE(first.GetWeights() == before);
  }
}

TEST_CASE("ReliefF weights stay in [-1, 1]", "[relieff]") {
  FeatureMatrix data;
  ClassVector target;
  MakeComparisonData(60, 5, DISCRETE_FEATURES, 0, 1, 9, data, target);
  WeightUpdateMode modes[] = { K_NEAREST_UPDATE, DIFF_UPDATE };
  for(unsigned int i = 0; i < 2; ++i) {
    WeightVector weights = relieff(data, target, DISCRETE_FEATURES, modes[i],
                                   3);
    for(unsigned int j = 0; j < weights.size(); ++j) {
      REQUIRE(weights[j] >= -1.0);
      REQUIRE(weights[j] <= 1.0);
    }
  }
}

TEST_CASE("ReliefF on identical instances gives zero weights", "[relieff]") {
  FeatureMatrix data(10, FeatureRow(4, 2.5));
  ClassVector target;
  for(unsigned int i = 0; i < 10; ++i) {
    target.push_back(i % 2);
  }
  WeightUpdateMode modes[] = { K_NEAREST_UPDATE, DIFF_UPDATE, EXP_RANK_UPDATE };
  for(unsigned int i = 0; i < 3; ++i) {
    WeightVector weights = relieff(data, target, CONTINUOUS_FEATURES,
                                   modes[i], 3);
    for(unsigned int j = 0; j < weights.size(); ++j) {
      REQUIRE(weights[j] == Approx(0.0).margin(1e-12));
    }
  }
}

TEST_CASE("ReliefF rejects bad options before the data", "[relieff][errors]") {
  FeatureMatrix empty;
  ClassVector none;
  REQUIRE_THROWS_AS(relieff(empty, none, (FeatureType) 2, K_NEAREST_UPDATE),
                    InvalidFeatureType);
  REQUIRE_THROWS_AS(relieff(empty, none, CONTINUOUS_FEATURES,
                            (WeightUpdateMode) 5),
                    InvalidMode);

  FeatureMatrix data;
  ClassVector target;
  MakeComparisonData(20, 4, CONTINUOUS_FEATURES, 0, 1, 1, data, target);
  REQUIRE_THROWS_AS(relieff(data, target, CONTINUOUS_FEATURES,
                            K_NEAREST_UPDATE, 0),
                    InvalidNeighborCount);
  REQUIRE_THROWS_AS(relieff(data, target, CONTINUOUS_FEATURES,
                            K_NEAREST_UPDATE, 20),
                    InvalidNeighborCount);
  // k is only used by k_nearest
  REQUIRE_NOTHROW(relieff(data, target, CONTINUOUS_FEATURES, DIFF_UPDATE, 0));
}

TEST_CASE("ReliefF configured by name", "[relieff][config]") {
  FeatureMatrix data;
  ClassVector target;
  MakeComparisonData(200, 10, DISCRETE_FEATURES, 0, 1, 2, data, target);

  ConfigMap config;
  config["f-type"] = "discrete";
  config["mode"] = "exp_rank";
  config["exp-rank-sigma"] = "10";
  WeightVector weights = relieff(data, target, config);
  REQUIRE(RelevantFeaturesLead(weights, 0, 1));
  REQUIRE(weights == relieff(data, target, DISCRETE_FEATURES, EXP_RANK_UPDATE));

  SECTION("defaults to k_nearest with k = 10") {
    Dataset ds;
    ds.LoadDataset(data, target, DISCRETE_FEATURES);
    ConfigMap noOptions;
    ReliefF ranker(&ds, noOptions);
    REQUIRE(ranker.GetMode() == K_NEAREST_UPDATE);
    REQUIRE(ranker.GetK() == DEFAULT_K_NEAREST_NEIGHBORS);
    REQUIRE(ranker.GetNumSamples() == 200);
  }
  SECTION("missing feature type") {
    config.erase("f-type");
    REQUIRE_THROWS_AS(relieff(data, target, config), InvalidFeatureType);
  }
  SECTION("unknown mode") {
    config["mode"] = "nearest";
    REQUIRE_THROWS_AS(relieff(data, target, config), InvalidMode);
  }
  SECTION("malformed number") {
    config["mode"] = "k_nearest";
    config["k-nearest-neighbors"] = "ten";
    REQUIRE_THROWS_AS(relieff(data, target, config), InvalidConfiguration);
  }
  SECTION("negative sample count") {
    config["mode"] = "diff";
    config["number-random-samples"] = "-1";
    REQUIRE_THROWS_AS(relieff(data, target, config), InvalidConfiguration);
  }
}
