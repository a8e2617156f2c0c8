/*
 * IterativeRelief.cpp
 *
 * Iterative Relief with an exponential distance kernel.
 * Each pass is parallel over instances with OpenMP; passes are sequential.
 */

#include <iostream>
#include <iomanip>
#include <vector>
#include <cmath>
#include <string>

#include <omp.h>

#include <boost/lexical_cast.hpp>

#include "IterativeRelief.h"
#include "AttributeRanker.h"
#include "Dataset.h"
#include "DatasetInstance.h"
#include "DistanceMetrics.h"
#include "NeighborSearch.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"

using namespace std;
using boost::lexical_cast;

IterativeRelief::IterativeRelief(Dataset* ds, unsigned int maxIterations,
                                 double kernelWidth,
                                 double convergenceTolerance) :
  AttributeRanker::AttributeRanker(ds) {
  cout << Timestamp() << "Iterative Relief initialization with parameters"
          << endl;
  iterations = maxIterations;
  sigma = kernelWidth;
  tolerance = convergenceTolerance;
  Initialize();
}

IterativeRelief::IterativeRelief(Dataset* ds, const ConfigMap& configMap) :
  AttributeRanker::AttributeRanker(ds) {
  cout << Timestamp() << "Iterative Relief initialization with "
          << "configuration map:" << endl;
  iterations = GetConfigValueAs<unsigned int>(configMap, "iterations",
                                              DEFAULT_ITERATIONS);
  sigma = GetConfigValueAs<double>(configMap, "kernel-width",
                                   DEFAULT_KERNEL_WIDTH);
  tolerance = GetConfigValueAs<double>(configMap, "tolerance",
                                       DEFAULT_TOLERANCE);
  Initialize();
}

IterativeRelief::~IterativeRelief() {
}

void IterativeRelief::Initialize() {
  if(iterations == 0) {
    throw InvalidIterationCount("at least one iteration is required");
  }
  if(!(sigma > 0.0)) {
    throw InvalidConfiguration("kernel-width must be positive, found " +
                               lexical_cast<string>(sigma));
  }
  if(tolerance < 0.0) {
    throw InvalidConfiguration("tolerance must not be negative, found " +
                               lexical_cast<string>(tolerance));
  }
  diffFunc = ChooseDiffFunction(dataset->GetFeatureType());
  converged = false;

  cout << Timestamp() << "Maximum iterations: " << iterations << endl;
  cout << Timestamp() << "Kernel width: " << sigma << endl;
  cout << Timestamp() << "Convergence tolerance: " << tolerance << endl;
  cout << Timestamp() << omp_get_num_procs()
          << " OpenMP processors available" << endl;
}

void IterativeRelief::AddKernelDiffs(unsigned int queryIndex,
                                     const NeighborSet& group,
                                     double sign,
                                     WeightVector& delta) const {
  if(!group.size()) {
    return;
  }
  // neighbor sets are sorted, so the first distance is the minimum
  double minDistance = group[0].distance;
  vector<double> factors(group.size());
  double factorSum = 0.0;
  for(unsigned int j = 0; j < group.size(); ++j) {
    factors[j] = exp(-(group[j].distance - minDistance) / sigma);
    factorSum += factors[j];
  }
  DatasetInstance* R_i = dataset->GetInstance(queryIndex);
  for(unsigned int j = 0; j < group.size(); ++j) {
    double factor = sign * factors[j] / factorSum;
    DatasetInstance* N_j = dataset->GetInstance(group[j].index);
    for(unsigned int A = 0; A < delta.size(); ++A) {
      delta[A] += factor * diffFunc(A, R_i, N_j);
    }
  }
}

void IterativeRelief::RunPass(const WeightVector& currentWeights,
                              WeightVector& nextWeights) {
  NeighborSearch neighborSearch(dataset);
  neighborSearch.PreComputeDistances(&currentWeights);

  unsigned int numFeatures = dataset->NumFeatures();
  int numInstances = dataset->NumInstances();
  vector<WeightVector> deltas(numInstances);
#pragma omp parallel for schedule(dynamic, 1)
  for(int i = 0; i < numInstances; ++i) {
    NeighborSet neighbors =
            neighborSearch.FindNeighbors(i, FULL_RANKING_SEARCH);
    NeighborSet hits, misses;
    for(NeighborSetCIt it = neighbors.begin(); it != neighbors.end(); ++it) {
      if(it->isHit) {
        hits.push_back(*it);
      } else {
        misses.push_back(*it);
      }
    }
    deltas[i].assign(numFeatures, 0.0);
    AddKernelDiffs(i, misses, 1.0, deltas[i]);
    AddKernelDiffs(i, hits, -1.0, deltas[i]);
  }

  // ordered fold of the instance contributions
  WeightVector z(numFeatures, 0.0);
  for(int i = 0; i < numInstances; ++i) {
    for(unsigned int A = 0; A < numFeatures; ++A) {
      z[A] += deltas[i][A];
    }
  }

  // clip at zero and scale to sum to 1
  double zSum = 0.0;
  for(unsigned int A = 0; A < numFeatures; ++A) {
    if(z[A] < 0.0) {
      z[A] = 0.0;
    }
    zSum += z[A];
  }
  nextWeights.resize(numFeatures);
  for(unsigned int A = 0; A < numFeatures; ++A) {
    if(zSum > 0.0) {
      nextWeights[A] = z[A] / zSum;
    } else {
      nextWeights[A] = 1.0 / (double) numFeatures;
    }
  }
  if(!(zSum > 0.0)) {
    cout << Timestamp() << "All weight estimates clipped, "
            << "resetting to uniform" << endl;
  }
}

bool IterativeRelief::ComputeAttributeScores() {
  unsigned int numFeatures = dataset->NumFeatures();
  WeightVector weights(numFeatures, 1.0 / (double) numFeatures);

  weightHistory.clear();
  changeHistory.clear();
  weightHistory.push_back(weights);
  converged = false;

  cout << Timestamp() << "Running Iterative Relief algorithm" << endl;
  for(unsigned int iteration = 1; iteration <= iterations; ++iteration) {
    WeightVector nextWeights;
    RunPass(weights, nextWeights);

    double change = 0.0;
    for(unsigned int A = 0; A < numFeatures; ++A) {
      change += fabs(nextWeights[A] - weights[A]);
    }
    weights = nextWeights;
    weightHistory.push_back(weights);
    changeHistory.push_back(change);
    cout << Timestamp() << "Iteration " << iteration << "/" << iterations
            << ", L1 change: " << setprecision(6) << change << endl;

    if(change < tolerance) {
      converged = true;
      break;
    }
  }
  if(converged) {
    cout << Timestamp() << "Converged after " << changeHistory.size()
            << " iterations" << endl;
  } else {
    cout << Timestamp() << "Stopped after " << iterations
            << " iterations without converging" << endl;
  }

  SetWeights(weights);

  return true;
}

AttributeScores IterativeRelief::ComputeScores() {
  ComputeAttributeScores();
  return GetScores();
}

vector<WeightVector> IterativeRelief::GetWeightHistory() const {
  return weightHistory;
}

vector<double> IterativeRelief::GetChangeHistory() const {
  return changeHistory;
}

unsigned int IterativeRelief::GetIterationsRun() const {
  return changeHistory.size();
}

bool IterativeRelief::Converged() const {
  return converged;
}
