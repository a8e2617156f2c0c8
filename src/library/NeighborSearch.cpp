/*
 * NeighborSearch.cpp
 *
 * Pairwise distances and nearest neighbor retrieval.
 * Distance matrix rows are filled with OpenMP.
 */

#include <iostream>
#include <vector>
#include <map>
#include <cmath>
#include <algorithm>
#include <functional>
#include <stdexcept>

#include <omp.h>

#include <boost/lexical_cast.hpp>

#include "NeighborSearch.h"
#include "Dataset.h"
#include "DatasetInstance.h"
#include "DistanceMetrics.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "best_n.h"

using namespace std;
using namespace featrelief;
using boost::lexical_cast;

NeighborSearch::NeighborSearch(Dataset* ds) {
  if(!ds) {
    throw InvalidDataset("data set is not initialized");
  }
  dataset = ds;
  diffFunc = ChooseDiffFunction(dataset->GetFeatureType());
  haveDistances = false;
}

NeighborSearch::~NeighborSearch() {
}

void NeighborSearch::CheckNeighborCount(unsigned int k,
                                        unsigned int numInstances) {
  if(k == 0) {
    throw InvalidNeighborCount("k must be at least 1");
  }
  if(k >= numInstances) {
    throw InvalidNeighborCount("k = " + lexical_cast<string>(k) +
                               " must be less than the number of instances " +
                               lexical_cast<string>(numInstances));
  }
}

bool NeighborSearch::PreComputeDistances(const WeightVector* featureWeights) {
  int numInstances = dataset->NumInstances();
  if(featureWeights && (featureWeights->size() != dataset->NumFeatures())) {
    throw InvalidDataset("expected " +
                         lexical_cast<string>(dataset->NumFeatures()) +
                         " feature weights, found " +
                         lexical_cast<string>(featureWeights->size()));
  }

  cout << Timestamp() << "Precomputing instance distances";
  if(featureWeights) {
    cout << " with feature weights";
  }
  cout << endl;
  distanceMatrix.assign(numInstances, vector<double>(numInstances, 0.0));

  // populate the matrix - upper triangular, then mirror
  // each cell is written by exactly one thread
#pragma omp parallel for schedule(dynamic, 1)
  for(int i = 0; i < numInstances; ++i) {
    DatasetInstance* dsi1 = dataset->GetInstance(i);
    for(int j = i + 1; j < numInstances; ++j) {
      distanceMatrix[i][j] = distanceMatrix[j][i] =
              ComputeInstanceDistance(diffFunc, dsi1,
                                      dataset->GetInstance(j),
                                      featureWeights);
    }
  }
  haveDistances = true;

  return true;
}

double NeighborSearch::GetDistance(unsigned int i, unsigned int j) const {
  if(!haveDistances) {
    throw logic_error("NeighborSearch::GetDistance: distances have not "
                      "been computed");
  }
  return distanceMatrix[i][j];
}

Neighbor NeighborSearch::MakeNeighbor(unsigned int i, unsigned int j) const {
  Neighbor neighbor;
  neighbor.index = j;
  neighbor.distance = distanceMatrix[i][j];
  neighbor.classLabel = dataset->GetClass(j);
  neighbor.isHit = (neighbor.classLabel == dataset->GetClass(i));
  return neighbor;
}

void NeighborSearch::AppendNeighbors(unsigned int queryIndex,
                                     DistancePairs& pairs,
                                     NeighborSet& neighbors) const {
  // distance pairs compare by distance, then by instance index
  sort(pairs.begin(), pairs.end());
  for(DistancePairsIt it = pairs.begin(); it != pairs.end(); ++it) {
    neighbors.push_back(MakeNeighbor(queryIndex, it->second));
  }
}

NeighborSet NeighborSearch::FindNeighbors(unsigned int queryIndex,
                                          NeighborSearchMode mode,
                                          unsigned int k) const {
  if(!haveDistances) {
    throw logic_error("NeighborSearch::FindNeighbors: distances have not "
                      "been computed");
  }
  unsigned int numInstances = dataset->NumInstances();
  if(queryIndex >= numInstances) {
    throw out_of_range("NeighborSearch::FindNeighbors: query index " +
                       lexical_cast<string>(queryIndex) + " is out of range");
  }

  NeighborSet neighbors;
  switch(mode) {
    case K_NEAREST_SEARCH: {
      CheckNeighborCount(k, numInstances);
      ClassLevel thisClass = dataset->GetClass(queryIndex);
      DistancePairs sameSums;
      map<ClassLevel, DistancePairs> diffSums;
      for(unsigned int j = 0; j < numInstances; ++j) {
        if(j == queryIndex) {
          continue;
        }
        DistancePair nnInfo = make_pair(distanceMatrix[queryIndex][j], j);
        ClassLevel otherClass = dataset->GetClass(j);
        if(otherClass == thisClass) {
          sameSums.push_back(nnInfo);
        } else {
          diffSums[otherClass].push_back(nnInfo);
        }
      }
      DistancePairs hits;
      best_n(sameSums.begin(), sameSums.end(), back_inserter(hits),
             min((size_t) k, sameSums.size()), less<DistancePair>());
      AppendNeighbors(queryIndex, hits, neighbors);
      map<ClassLevel, DistancePairs>::iterator it;
      for(it = diffSums.begin(); it != diffSums.end(); ++it) {
        DistancePairs misses;
        best_n(it->second.begin(), it->second.end(), back_inserter(misses),
               min((size_t) k, it->second.size()), less<DistancePair>());
        AppendNeighbors(queryIndex, misses, neighbors);
      }
      break;
    }
    case FULL_RANKING_SEARCH: {
      DistancePairs all;
      all.reserve(numInstances - 1);
      for(unsigned int j = 0; j < numInstances; ++j) {
        if(j == queryIndex) {
          continue;
        }
        all.push_back(make_pair(distanceMatrix[queryIndex][j], j));
      }
      AppendNeighbors(queryIndex, all, neighbors);
      break;
    }
    default:
      throw logic_error("NeighborSearch::FindNeighbors: unknown search mode");
  }

  return neighbors;
}

NeighborSet NeighborSearch::FindNeighborsWithin(unsigned int queryIndex,
                                                double threshold) const {
  DistancePairs near;
  for(unsigned int j = 0; j < dataset->NumInstances(); ++j) {
    if((j != queryIndex) && (GetDistance(queryIndex, j) < threshold)) {
      near.push_back(make_pair(distanceMatrix[queryIndex][j], j));
    }
  }
  NeighborSet neighbors;
  AppendNeighbors(queryIndex, near, neighbors);
  return neighbors;
}

NeighborSet NeighborSearch::FindNeighborsBeyond(unsigned int queryIndex,
                                                double threshold) const {
  DistancePairs far;
  for(unsigned int j = 0; j < dataset->NumInstances(); ++j) {
    if((j != queryIndex) && (GetDistance(queryIndex, j) > threshold)) {
      far.push_back(make_pair(distanceMatrix[queryIndex][j], j));
    }
  }
  NeighborSet neighbors;
  AppendNeighbors(queryIndex, far, neighbors);
  return neighbors;
}

double NeighborSearch::MeanPairwiseDistance() const {
  unsigned int numInstances = dataset->NumInstances();
  double distanceSum = 0.0;
  for(unsigned int i = 0; i < numInstances; ++i) {
    for(unsigned int j = i + 1; j < numInstances; ++j) {
      distanceSum += GetDistance(i, j);
    }
  }
  double numPairs = (double) numInstances * (numInstances - 1) / 2.0;
  return distanceSum / numPairs;
}

pair<double, double>
NeighborSearch::InstanceDistanceStats(unsigned int queryIndex) const {
  unsigned int numInstances = dataset->NumInstances();
  double n = (double) (numInstances - 1);
  double sum = 0.0;
  for(unsigned int j = 0; j < numInstances; ++j) {
    if(j != queryIndex) {
      sum += GetDistance(queryIndex, j);
    }
  }
  double mean = sum / n;
  double variance = 0.0;
  for(unsigned int j = 0; j < numInstances; ++j) {
    if(j != queryIndex) {
      double deviation = distanceMatrix[queryIndex][j] - mean;
      variance += deviation * deviation;
    }
  }
  variance /= n;
  return make_pair(mean, sqrt(variance));
}

DiffFunction NeighborSearch::GetDiffFunction() const {
  return diffFunc;
}
