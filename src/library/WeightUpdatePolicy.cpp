/*
 * WeightUpdatePolicy.cpp
 *
 * ReliefF weight update strategies: k_nearest, diff and exp_rank.
 */

#include <cmath>
#include <vector>
#include <map>

#include <boost/lexical_cast.hpp>

#include "WeightUpdatePolicy.h"
#include "Dataset.h"
#include "DatasetInstance.h"
#include "DistanceMetrics.h"
#include "NeighborSearch.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"

using namespace std;

WeightUpdatePolicy::WeightUpdatePolicy(Dataset* ds,
                                       DiffFunction diffFunction) {
  dataset = ds;
  diffFunc = diffFunction;
}

WeightUpdatePolicy::~WeightUpdatePolicy() {
}

WeightUpdatePolicy::NeighborGroups
WeightUpdatePolicy::GroupNeighbors(const NeighborSet& neighbors) const {
  NeighborGroups groups;
  for(NeighborSetCIt it = neighbors.begin(); it != neighbors.end(); ++it) {
    if(it->isHit) {
      groups.hits.push_back(it->index);
    } else {
      groups.misses[it->classLabel].push_back(it->index);
    }
  }
  return groups;
}

double WeightUpdatePolicy::MissAdjustment(ClassLevel missClass,
                                          ClassLevel queryClass) const {
  double P_C = dataset->GetClassProbability(missClass);
  double P_C_R = dataset->GetClassProbability(queryClass);
  return P_C / (1.0 - P_C_R);
}

void WeightUpdatePolicy::AddScaledDiffs(unsigned int queryIndex,
                                        unsigned int neighborIndex,
                                        double factor,
                                        WeightVector& delta) const {
  DatasetInstance* R_i = dataset->GetInstance(queryIndex);
  DatasetInstance* N_j = dataset->GetInstance(neighborIndex);
  for(unsigned int A = 0; A < delta.size(); ++A) {
    delta[A] += factor * diffFunc(A, R_i, N_j);
  }
}

// ---------------------------------------------------------------- k_nearest

KNearestWeightUpdate::KNearestWeightUpdate(Dataset* ds,
                                           DiffFunction diffFunction) :
  WeightUpdatePolicy(ds, diffFunction) {
}

WeightUpdateMode KNearestWeightUpdate::GetMode() const {
  return K_NEAREST_UPDATE;
}

NeighborSearchMode KNearestWeightUpdate::GetSearchMode() const {
  return K_NEAREST_SEARCH;
}

void KNearestWeightUpdate::ComputeDelta(unsigned int queryIndex,
                                        const NeighborSet& neighbors,
                                        WeightVector& delta) const {
  delta.assign(dataset->NumFeatures(), 0.0);
  ClassLevel class_R_i = dataset->GetClass(queryIndex);
  NeighborGroups groups = GroupNeighbors(neighbors);

  // groups smaller than k average over the members found
  if(groups.hits.size()) {
    double hitFactor = -1.0 / (double) groups.hits.size();
    for(unsigned int j = 0; j < groups.hits.size(); ++j) {
      AddScaledDiffs(queryIndex, groups.hits[j], hitFactor, delta);
    }
  }
  map<ClassLevel, vector<unsigned int> >::const_iterator mit;
  for(mit = groups.misses.begin(); mit != groups.misses.end(); ++mit) {
    const vector<unsigned int>& missIds = mit->second;
    double adjustmentFactor = MissAdjustment(mit->first, class_R_i);
    double missFactor = adjustmentFactor / (double) missIds.size();
    for(unsigned int j = 0; j < missIds.size(); ++j) {
      AddScaledDiffs(queryIndex, missIds[j], missFactor, delta);
    }
  }
}

double KNearestWeightUpdate::NormalizingFactor(unsigned int m) const {
  // the group averages already divide by k
  return 1.0 / (double) m;
}

// --------------------------------------------------------------------- diff

DiffWeightUpdate::DiffWeightUpdate(Dataset* ds, DiffFunction diffFunction) :
  WeightUpdatePolicy(ds, diffFunction) {
}

WeightUpdateMode DiffWeightUpdate::GetMode() const {
  return DIFF_UPDATE;
}

NeighborSearchMode DiffWeightUpdate::GetSearchMode() const {
  return FULL_RANKING_SEARCH;
}

void DiffWeightUpdate::ComputeDelta(unsigned int queryIndex,
                                    const NeighborSet& neighbors,
                                    WeightVector& delta) const {
  delta.assign(dataset->NumFeatures(), 0.0);
  for(NeighborSetCIt it = neighbors.begin(); it != neighbors.end(); ++it) {
    AddScaledDiffs(queryIndex, it->index, it->isHit ? -1.0 : 1.0, delta);
  }
}

double DiffWeightUpdate::NormalizingFactor(unsigned int m) const {
  // m x (N - 1) comparisons
  return 1.0 / ((double) m * (double) (dataset->NumInstances() - 1));
}

// ----------------------------------------------------------------- exp_rank

ExpRankWeightUpdate::ExpRankWeightUpdate(Dataset* ds,
                                         DiffFunction diffFunction,
                                         double rankSigma) :
  WeightUpdatePolicy(ds, diffFunction) {
  if(!(rankSigma > 0.0)) {
    throw InvalidConfiguration("exp_rank sigma must be positive, found " +
                               boost::lexical_cast<string>(rankSigma));
  }
  sigma = rankSigma;
}

WeightUpdateMode ExpRankWeightUpdate::GetMode() const {
  return EXP_RANK_UPDATE;
}

NeighborSearchMode ExpRankWeightUpdate::GetSearchMode() const {
  return FULL_RANKING_SEARCH;
}

vector<double> ExpRankWeightUpdate::RankInfluenceFactors(unsigned int n) const {
  vector<double> d1_ij;
  double d1_ij_sum = 0.0;
  for(unsigned int rank_j = 1; rank_j <= n; ++rank_j) {
    double exponentArg = (double) rank_j / sigma;
    double d1_ij_value = exp(-(exponentArg * exponentArg));
    d1_ij.push_back(d1_ij_value);
    d1_ij_sum += d1_ij_value;
  }
  // "normalize" the factors - divide through by the total/sum
  if(d1_ij_sum > 0.0) {
    for(unsigned int j = 0; j < n; ++j) {
      d1_ij[j] /= d1_ij_sum;
    }
  }
  return d1_ij;
}

void ExpRankWeightUpdate::ComputeDelta(unsigned int queryIndex,
                                       const NeighborSet& neighbors,
                                       WeightVector& delta) const {
  delta.assign(dataset->NumFeatures(), 0.0);
  ClassLevel class_R_i = dataset->GetClass(queryIndex);
  // groups keep the ascending distance order of the full ranking
  NeighborGroups groups = GroupNeighbors(neighbors);

  vector<double> hitFactors = RankInfluenceFactors(groups.hits.size());
  for(unsigned int j = 0; j < groups.hits.size(); ++j) {
    AddScaledDiffs(queryIndex, groups.hits[j], -hitFactors[j], delta);
  }
  map<ClassLevel, vector<unsigned int> >::const_iterator mit;
  for(mit = groups.misses.begin(); mit != groups.misses.end(); ++mit) {
    const vector<unsigned int>& missIds = mit->second;
    double adjustmentFactor = MissAdjustment(mit->first, class_R_i);
    vector<double> missFactors = RankInfluenceFactors(missIds.size());
    for(unsigned int j = 0; j < missIds.size(); ++j) {
      AddScaledDiffs(queryIndex, missIds[j],
                     adjustmentFactor * missFactors[j], delta);
    }
  }
}

double ExpRankWeightUpdate::NormalizingFactor(unsigned int m) const {
  return 1.0 / (double) m;
}

WeightUpdatePolicy* CreateWeightUpdatePolicy(WeightUpdateMode mode,
                                             Dataset* ds,
                                             DiffFunction diffFunction,
                                             double rankSigma) {
  switch(mode) {
    case K_NEAREST_UPDATE:
      return new KNearestWeightUpdate(ds, diffFunction);
    case DIFF_UPDATE:
      return new DiffWeightUpdate(ds, diffFunction);
    case EXP_RANK_UPDATE:
      return new ExpRankWeightUpdate(ds, diffFunction, rankSigma);
  }
  throw InvalidMode("no weight update policy for mode value " +
                    boost::lexical_cast<string>((int) mode));
}
