/*
 * SURF.cpp
 *
 * Threshold neighborhood Relief: SURF, and the base of SURF* and MultiSURF.
 */

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>

#include <omp.h>

#include "SURF.h"
#include "AttributeRanker.h"
#include "Dataset.h"
#include "DatasetInstance.h"
#include "DistanceMetrics.h"
#include "NeighborSearch.h"
#include "FeatRelief.h"

using namespace std;

SURF::SURF(Dataset* ds) : AttributeRanker::AttributeRanker(ds) {
  diffFunc = ChooseDiffFunction(dataset->GetFeatureType());
  meanDistance = 0.0;
}

SURF::~SURF() {
}

string SURF::Name() const {
  return "SURF";
}

void SURF::PrepareThresholds(const NeighborSearch& neighborSearch) {
  meanDistance = neighborSearch.MeanPairwiseDistance();
  cout << Timestamp() << "Mean pairwise distance threshold: "
          << setprecision(6) << meanDistance << endl;
}

double SURF::NearThreshold(const NeighborSearch& neighborSearch,
                           unsigned int queryIndex) const {
  return meanDistance;
}

bool SURF::UseFarNeighbors() const {
  return false;
}

void SURF::AddMeanDiffs(unsigned int queryIndex, const NeighborSet& neighbors,
                        bool hits, double sign, WeightVector& delta) const {
  DatasetInstance* R_i = dataset->GetInstance(queryIndex);
  WeightVector diffSums(delta.size(), 0.0);
  unsigned int count = 0;
  for(NeighborSetCIt it = neighbors.begin(); it != neighbors.end(); ++it) {
    if(it->isHit != hits) {
      continue;
    }
    DatasetInstance* N_j = dataset->GetInstance(it->index);
    for(unsigned int A = 0; A < delta.size(); ++A) {
      diffSums[A] += diffFunc(A, R_i, N_j);
    }
    ++count;
  }
  // an empty group contributes nothing
  if(!count) {
    return;
  }
  for(unsigned int A = 0; A < delta.size(); ++A) {
    delta[A] += sign * diffSums[A] / (double) count;
  }
}

bool SURF::ComputeAttributeScores() {
  NeighborSearch neighborSearch(dataset);
  neighborSearch.PreComputeDistances();
  PrepareThresholds(neighborSearch);

  unsigned int numFeatures = dataset->NumFeatures();
  int numInstances = dataset->NumInstances();
  bool useFar = UseFarNeighbors();

  cout << Timestamp() << "Running " << Name() << " algorithm" << endl;
  vector<WeightVector> deltas(numInstances);
#pragma omp parallel for schedule(dynamic, 1)
  for(int i = 0; i < numInstances; ++i) {
    deltas[i].assign(numFeatures, 0.0);
    double threshold = NearThreshold(neighborSearch, i);
    NeighborSet near = neighborSearch.FindNeighborsWithin(i, threshold);
    AddMeanDiffs(i, near, false, 1.0, deltas[i]);
    AddMeanDiffs(i, near, true, -1.0, deltas[i]);
    if(useFar) {
      NeighborSet far = neighborSearch.FindNeighborsBeyond(i, threshold);
      AddMeanDiffs(i, far, true, 1.0, deltas[i]);
      AddMeanDiffs(i, far, false, -1.0, deltas[i]);
    }
  }

  WeightVector weights(numFeatures, 0.0);
  for(int i = 0; i < numInstances; ++i) {
    for(unsigned int A = 0; A < numFeatures; ++A) {
      weights[A] += deltas[i][A];
    }
    // happy lights
    if(i && ((i % 100) == 0)) {
      cout << Timestamp() << i << "/" << numInstances << endl;
    }
  }
  for(unsigned int A = 0; A < numFeatures; ++A) {
    weights[A] /= (double) numInstances;
  }
  cout << Timestamp() << numInstances << "/" << numInstances << " done"
          << endl;

  SetWeights(weights);

  return true;
}

AttributeScores SURF::ComputeScores() {
  ComputeAttributeScores();
  return GetScores();
}
