#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/scoped_ptr.hpp>

#include "AttributeRanker.h"
#include "Dataset.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "ReliefFunctions.h"
#include "TestData.h"

using namespace std;

namespace {

/// ranker returning a fixed weight vector
class FixedRanker : public AttributeRanker {
public:
  FixedRanker(Dataset* ds, const WeightVector& weights) :
    AttributeRanker(ds), fixedWeights(weights) {
  }
  AttributeScores ComputeScores() {
    SetWeights(fixedWeights);
    return GetScores();
  }
private:
  WeightVector fixedWeights;
};

/// four instances, four features named a..d
void LoadFourFeatures(Dataset& ds) {
  FeatureMatrix data;
  ClassVector target;
  for(unsigned int i = 0; i < 4; ++i) {
    data.push_back(FeatureRow(4, (double) i));
    target.push_back(i % 2);
  }
  vector<string> names;
  names.push_back("a");
  names.push_back("b");
  names.push_back("c");
  names.push_back("d");
  ds.LoadDataset(data, target, CONTINUOUS_FEATURES, names);
}

WeightVector TiedWeights() {
  WeightVector weights;
  weights.push_back(0.1);
  weights.push_back(0.5);
  weights.push_back(0.1);
  weights.push_back(-0.2);
  return weights;
}

}

TEST_CASE("Ranking is ordinal with ties broken by column", "[ranker]") {
  Dataset ds;
  LoadFourFeatures(ds);
  FixedRanker ranker(&ds, TiedWeights());
  REQUIRE_THROWS_AS(ranker.GetRanking(), std::logic_error);

  AttributeScores scores = ranker.ComputeScores();
  REQUIRE(scores.size() == 4);
  REQUIRE(scores[1].first == 0.5);
  REQUIRE(scores[1].second == "b");

  vector<unsigned int> ranks = ranker.GetRanking();
  REQUIRE(ranks[0] == 2);
  REQUIRE(ranks[1] == 1);
  REQUIRE(ranks[2] == 3);
  REQUIRE(ranks[3] == 4);
}

TEST_CASE("Top features are returned in column order", "[ranker]") {
  Dataset ds;
  LoadFourFeatures(ds);
  FixedRanker ranker(&ds, TiedWeights());
  ranker.ComputeScores();

  vector<unsigned int> selected = ranker.SelectTopFeatures(2);
  REQUIRE(selected.size() == 2);
  REQUIRE(selected[0] == 0);
  REQUIRE(selected[1] == 1);

  REQUIRE(ranker.SelectTopFeatures(0).empty());
  REQUIRE(ranker.SelectTopFeatures(10).size() == 4);
}

TEST_CASE("Scores print best first", "[ranker]") {
  Dataset ds;
  LoadFourFeatures(ds);
  FixedRanker ranker(&ds, TiedWeights());
  ranker.ComputeScores();

  ostringstream out;
  out.precision(3);
  ranker.PrintScores(out, 2);
  REQUIRE(out.str() == "0.50000000\tb\n0.10000000\ta\n");
  REQUIRE(out.precision() == 3);

  ostringstream all;
  ranker.PrintScores(all);
  REQUIRE(all.str() ==
          "0.50000000\tb\n0.10000000\ta\n0.10000000\tc\n-0.20000000\td\n");
}

TEST_CASE("Selected columns reduce a sample matrix", "[ranker]") {
  FeatureMatrix data;
  for(unsigned int i = 0; i < 3; ++i) {
    FeatureRow row;
    for(unsigned int j = 0; j < 4; ++j) {
      row.push_back(10.0 * i + j);
    }
    data.push_back(row);
  }
  vector<unsigned int> columns;
  columns.push_back(3);
  columns.push_back(1);

  FeatureMatrix reduced = SelectFeatureColumns(data, columns);
  REQUIRE(reduced.size() == 3);
  REQUIRE(reduced[2].size() == 2);
  REQUIRE(reduced[2][0] == 23.0);
  REQUIRE(reduced[2][1] == 21.0);

  columns.push_back(4);
  REQUIRE_THROWS_AS(SelectFeatureColumns(data, columns), std::out_of_range);
}

TEST_CASE("Rankers are created by algorithm name", "[ranker][config]") {
  FeatureMatrix data;
  ClassVector target;
  MakeComparisonData(30, 4, DISCRETE_FEATURES, 0, 1, 3, data, target);
  Dataset ds;
  ds.LoadDataset(data, target, DISCRETE_FEATURES);
  ConfigMap config;
  config["k-nearest-neighbors"] = "5";
  config["iterations"] = "3";

  const char* names[] = { "relieff", "iterative-relief", "surf", "surfstar",
                          "MultiSURF" };
  for(unsigned int i = 0; i < 5; ++i) {
    INFO("algorithm " << names[i]);
    boost::scoped_ptr<AttributeRanker> ranker(CreateRanker(names[i], &ds,
                                                           config));
    AttributeScores scores = ranker->ComputeScores();
    REQUIRE(scores.size() == 4);
    REQUIRE(ranker->GetWeights().size() == 4);
  }
  REQUIRE_THROWS_AS(CreateRanker("relief-f", &ds, config),
                    InvalidConfiguration);
  REQUIRE_THROWS_AS(FixedRanker(NULL, TiedWeights()), InvalidDataset);
}

TEST_CASE("Option names parse case-insensitively", "[config]") {
  REQUIRE(FeatureTypeFromString("Continuous") == CONTINUOUS_FEATURES);
  REQUIRE(FeatureTypeFromString(" discrete ") == DISCRETE_FEATURES);
  REQUIRE_THROWS_AS(FeatureTypeFromString("numeric"), InvalidFeatureType);
  REQUIRE(FeatureTypeName(DISCRETE_FEATURES) == "discrete");

  REQUIRE(WeightUpdateModeFromString("k_nearest") == K_NEAREST_UPDATE);
  REQUIRE(WeightUpdateModeFromString("DIFF") == DIFF_UPDATE);
  REQUIRE(WeightUpdateModeFromString("exp_rank") == EXP_RANK_UPDATE);
  REQUIRE_THROWS_AS(WeightUpdateModeFromString("rank"), InvalidMode);
  REQUIRE(WeightUpdateModeName(EXP_RANK_UPDATE) == "exp_rank");
  REQUIRE_THROWS_AS(CheckWeightUpdateMode((WeightUpdateMode) 7), InvalidMode);

  ConfigMap config;
  REQUIRE_THROWS_AS(FeatureTypeFromConfig(config), InvalidFeatureType);
  config["f-type"] = "discrete";
  REQUIRE(FeatureTypeFromConfig(config) == DISCRETE_FEATURES);
}

TEST_CASE("Typed configuration values", "[config]") {
  ConfigMap config;
  config["k-nearest-neighbors"] = "7";
  config["exp-rank-sigma"] = "2.5";
  config["tolerance"] = "small";
  config["empty"] = "";

  string value;
  REQUIRE(GetConfigValue(config, "k-nearest-neighbors", value));
  REQUIRE(value == "7");
  REQUIRE_FALSE(GetConfigValue(config, "missing", value));
  REQUIRE_FALSE(GetConfigValue(config, "empty", value));

  REQUIRE(GetConfigValueAs<unsigned int>(config, "k-nearest-neighbors", 10)
          == 7);
  REQUIRE(GetConfigValueAs<double>(config, "exp-rank-sigma", 10.0) == 2.5);
  REQUIRE(GetConfigValueAs<unsigned int>(config, "missing", 10) == 10);
  REQUIRE_THROWS_AS(GetConfigValueAs<double>(config, "tolerance", 1e-5),
                    InvalidConfiguration);

  // negative values never wrap into unsigned types
  config["number-random-samples"] = "-1";
  config["exp-rank-sigma"] = "-1.5";
  REQUIRE_THROWS_AS(GetConfigValueAs<unsigned int>(config,
                                                   "number-random-samples", 0),
                    InvalidConfiguration);
  REQUIRE_THROWS_AS(GetConfigValueAs<unsigned long>(config,
                                                    "number-random-samples", 0),
                    InvalidConfiguration);
  REQUIRE(GetConfigValueAs<double>(config, "exp-rank-sigma", 10.0) == -1.5);
}
