#include <catch2/catch.hpp>

#include <vector>

#include "Dataset.h"
#include "DatasetInstance.h"
#include "DistanceMetrics.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"

using namespace std;

namespace {

/// three instances, features: spread 0..4, constant 7, levels 0/1/2
void LoadThreeRows(Dataset& ds, FeatureType featureType) {
  FeatureMatrix data;
  FeatureRow r0, r1, r2;
  r0.push_back(0.0); r0.push_back(7.0); r0.push_back(0.0);
  r1.push_back(1.0); r1.push_back(7.0); r1.push_back(1.0);
  r2.push_back(4.0); r2.push_back(7.0); r2.push_back(2.0);
  data.push_back(r0);
  data.push_back(r1);
  data.push_back(r2);
  ClassVector target;
  target.push_back(0);
  target.push_back(1);
  target.push_back(0);
  ds.LoadDataset(data, target, featureType);
}

}

TEST_CASE("Continuous diff is range normalized", "[distance]") {
  Dataset ds;
  LoadThreeRows(ds, CONTINUOUS_FEATURES);
  DatasetInstance* a = ds.GetInstance(0);
  DatasetInstance* b = ds.GetInstance(1);
  DatasetInstance* c = ds.GetInstance(2);

  REQUIRE(diffManhattan(0, a, b) == Approx(0.25));
  REQUIRE(diffManhattan(0, a, c) == Approx(1.0));
  REQUIRE(diffManhattan(0, c, b) == Approx(0.75));
  // degenerate range of a constant feature
  REQUIRE(diffManhattan(1, a, c) == 0.0);
  REQUIRE(diffManhattan(0, b, b) == 0.0);
}

TEST_CASE("Discrete diff is a mismatch indicator", "[distance]") {
  Dataset ds;
  LoadThreeRows(ds, DISCRETE_FEATURES);
  DatasetInstance* a = ds.GetInstance(0);
  DatasetInstance* c = ds.GetInstance(2);

  REQUIRE(diffMismatch(0, a, c) == 1.0);
  REQUIRE(diffMismatch(1, a, c) == 0.0);
  REQUIRE(diffMismatch(2, a, a) == 0.0);
}

TEST_CASE("Diff function follows the feature type", "[distance]") {
  REQUIRE(ChooseDiffFunction(CONTINUOUS_FEATURES) == diffManhattan);
  REQUIRE(ChooseDiffFunction(DISCRETE_FEATURES) == diffMismatch);
  REQUIRE_THROWS_AS(ChooseDiffFunction((FeatureType) 2), InvalidFeatureType);
}

TEST_CASE("Feature diffs and aggregate distance", "[distance]") {
  Dataset ds;
  LoadThreeRows(ds, CONTINUOUS_FEATURES);
  DatasetInstance* a = ds.GetInstance(0);
  DatasetInstance* c = ds.GetInstance(2);

  vector<double> diffs;
  ComputeFeatureDiffs(diffManhattan, a, c, diffs);
  REQUIRE(diffs.size() == 3);
  REQUIRE(diffs[0] == Approx(1.0));
  REQUIRE(diffs[1] == 0.0);
  REQUIRE(diffs[2] == Approx(1.0));

  REQUIRE(ComputeInstanceDistance(diffManhattan, a, c) == Approx(2.0));

  WeightVector weights;
  weights.push_back(0.5);
  weights.push_back(10.0);
  weights.push_back(0.25);
  REQUIRE(ComputeInstanceDistance(diffManhattan, a, c, &weights) ==
          Approx(0.75));
}
