#include <catch2/catch.hpp>

#include <cmath>
#include <vector>
#include <utility>

#include "Dataset.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "NeighborSearch.h"

using namespace std;

namespace {

/// one feature on a line: 0, 1, 2, 3, 5, 8; classes 0 0 1 1 2 2
void LoadLine(Dataset& ds) {
  double values[] = { 0.0, 1.0, 2.0, 3.0, 5.0, 8.0 };
  ClassLevel classes[] = { 0, 0, 1, 1, 2, 2 };
  FeatureMatrix data;
  ClassVector target;
  for(unsigned int i = 0; i < 6; ++i) {
    data.push_back(FeatureRow(1, values[i]));
    target.push_back(classes[i]);
  }
  ds.LoadDataset(data, target, CONTINUOUS_FEATURES);
}

}

TEST_CASE("Distance matrix is symmetric with a zero diagonal",
          "[neighbors]") {
  Dataset ds;
  LoadLine(ds);
  NeighborSearch search(&ds);
  REQUIRE_THROWS_AS(search.GetDistance(0, 1), std::logic_error);
  search.PreComputeDistances();

  for(unsigned int i = 0; i < ds.NumInstances(); ++i) {
    REQUIRE(search.GetDistance(i, i) == 0.0);
    for(unsigned int j = 0; j < ds.NumInstances(); ++j) {
      REQUIRE(search.GetDistance(i, j) == search.GetDistance(j, i));
    }
  }
  // range is 8
  REQUIRE(search.GetDistance(0, 5) == Approx(1.0));
  REQUIRE(search.GetDistance(1, 3) == Approx(0.25));
}

TEST_CASE("Feature weights scale the distances", "[neighbors]") {
  Dataset ds;
  LoadLine(ds);
  NeighborSearch search(&ds);
  WeightVector weights(1, 0.5);
  search.PreComputeDistances(&weights);
  REQUIRE(search.GetDistance(0, 5) == Approx(0.5));

  WeightVector wrongSize(2, 0.5);
  REQUIRE_THROWS_AS(search.PreComputeDistances(&wrongSize), InvalidDataset);
}

TEST_CASE("k nearest hits and misses per class", "[neighbors]") {
  Dataset ds;
  LoadLine(ds);
  NeighborSearch search(&ds);
  search.PreComputeDistances();

  NeighborSet neighbors = search.FindNeighbors(2, K_NEAREST_SEARCH, 1);
  // one hit, one miss of class 0, one miss of class 2
  REQUIRE(neighbors.size() == 3);
  REQUIRE(neighbors[0].isHit);
  REQUIRE(neighbors[0].index == 3);
  REQUIRE_FALSE(neighbors[1].isHit);
  REQUIRE(neighbors[1].classLabel == 0);
  REQUIRE(neighbors[1].index == 1);
  REQUIRE(neighbors[2].classLabel == 2);
  REQUIRE(neighbors[2].index == 4);

  // groups smaller than k return all members
  neighbors = search.FindNeighbors(2, K_NEAREST_SEARCH, 3);
  REQUIRE(neighbors.size() == 5);
  REQUIRE(neighbors[1].index == 1);
  REQUIRE(neighbors[2].index == 0);
}

TEST_CASE("k nearest ties are broken by instance index", "[neighbors]") {
  FeatureMatrix data;
  ClassVector target;
  // instance 0 at 0, instances 1..4 all at distance 1
  double values[] = { 0.0, 1.0, 1.0, 1.0, 1.0 };
  for(unsigned int i = 0; i < 5; ++i) {
    data.push_back(FeatureRow(1, values[i]));
    target.push_back(0);
  }
  Dataset ds;
  ds.LoadDataset(data, target, DISCRETE_FEATURES);
  NeighborSearch search(&ds);
  search.PreComputeDistances();

  NeighborSet neighbors = search.FindNeighbors(0, K_NEAREST_SEARCH, 2);
  REQUIRE(neighbors.size() == 2);
  REQUIRE(neighbors[0].index == 1);
  REQUIRE(neighbors[1].index == 2);
}

TEST_CASE("Full ranking orders every other instance", "[neighbors]") {
  Dataset ds;
  LoadLine(ds);
  NeighborSearch search(&ds);
  search.PreComputeDistances();

  NeighborSet neighbors = search.FindNeighbors(0, FULL_RANKING_SEARCH);
  REQUIRE(neighbors.size() == 5);
  for(unsigned int j = 0; j < neighbors.size(); ++j) {
    REQUIRE(neighbors[j].index == j + 1);
  }
  REQUIRE(neighbors[0].isHit);
  REQUIRE_FALSE(neighbors[1].isHit);
}

TEST_CASE("Bad neighbor counts are rejected", "[neighbors][errors]") {
  Dataset ds;
  LoadLine(ds);
  NeighborSearch search(&ds);
  search.PreComputeDistances();

  REQUIRE_THROWS_AS(search.FindNeighbors(0, K_NEAREST_SEARCH, 0),
                    InvalidNeighborCount);
  REQUIRE_THROWS_AS(search.FindNeighbors(0, K_NEAREST_SEARCH, 6),
                    InvalidNeighborCount);
  REQUIRE_NOTHROW(search.FindNeighbors(0, K_NEAREST_SEARCH, 5));
}

TEST_CASE("Threshold neighborhoods and distance statistics",
          "[neighbors]") {
  Dataset ds;
  LoadLine(ds);
  NeighborSearch search(&ds);
  search.PreComputeDistances();

  // distances from instance 0: 1, 2, 3, 5, 8 over range 8
  NeighborSet near = search.FindNeighborsWithin(0, 0.3);
  REQUIRE(near.size() == 2);
  REQUIRE(near[0].index == 1);
  REQUIRE(near[1].index == 2);

  NeighborSet far = search.FindNeighborsBeyond(0, 0.375);
  REQUIRE(far.size() == 2);
  REQUIRE(far[0].index == 4);
  REQUIRE(far[1].index == 5);

  pair<double, double> stats = search.InstanceDistanceStats(0);
  double mean = 19.0 / 8.0 / 5.0;
  REQUIRE(stats.first == Approx(mean));
  double variance = 0.0;
  double d[] = { 1.0, 2.0, 3.0, 5.0, 8.0 };
  for(unsigned int j = 0; j < 5; ++j) {
    variance += (d[j] / 8.0 - mean) * (d[j] / 8.0 - mean);
  }
  REQUIRE(stats.second == Approx(sqrt(variance / 5.0)));

  double total = 0.0;
  for(unsigned int i = 0; i < 6; ++i) {
    for(unsigned int j = i + 1; j < 6; ++j) {
      total += search.GetDistance(i, j);
    }
  }
  REQUIRE(search.MeanPairwiseDistance() == Approx(total / 15.0));
}
