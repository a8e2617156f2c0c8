/*
 * ReliefFunctions.cpp
 *
 * Function-level interface: load a Dataset from memory, run one ranker and
 * return its weights.
 */

#include <string>

#include "ReliefFunctions.h"
#include "AttributeRanker.h"
#include "Dataset.h"
#include "ReliefF.h"
#include "IterativeRelief.h"
#include "SURF.h"
#include "SURFStar.h"
#include "MultiSURF.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "StringUtils.h"

using namespace std;
using namespace featrelief;

FeatureType FeatureTypeFromConfig(const ConfigMap& configMap) {
  string configValue;
  if(!GetConfigValue(configMap, "f-type", configValue)) {
    throw InvalidFeatureType("f-type is required: continuous|discrete");
  }
  return FeatureTypeFromString(configValue);
}

WeightVector relieff(const FeatureMatrix& data, const ClassVector& target,
                     FeatureType featureType, WeightUpdateMode mode,
                     unsigned int k) {
  CheckFeatureType(featureType);
  CheckWeightUpdateMode(mode);
  Dataset ds;
  ds.LoadDataset(data, target, featureType);
  ReliefF ranker(&ds, mode, k);
  ranker.ComputeAttributeScores();
  return ranker.GetWeights();
}

WeightVector relieff(const FeatureMatrix& data, const ClassVector& target,
                     const ConfigMap& configMap) {
  FeatureType featureType = FeatureTypeFromConfig(configMap);
  string configValue;
  if(GetConfigValue(configMap, "mode", configValue)) {
    WeightUpdateModeFromString(configValue);
  }
  Dataset ds;
  ds.LoadDataset(data, target, featureType);
  ReliefF ranker(&ds, configMap);
  ranker.ComputeAttributeScores();
  return ranker.GetWeights();
}

WeightVector iterative_relief(const FeatureMatrix& data,
                              const ClassVector& target,
                              FeatureType featureType,
                              unsigned int iterations) {
  CheckFeatureType(featureType);
  if(iterations == 0) {
    throw InvalidIterationCount("at least one iteration is required");
  }
  Dataset ds;
  ds.LoadDataset(data, target, featureType);
  IterativeRelief ranker(&ds, iterations);
  ranker.ComputeAttributeScores();
  return ranker.GetWeights();
}

WeightVector iterative_relief(const FeatureMatrix& data,
                              const ClassVector& target,
                              const ConfigMap& configMap) {
  FeatureType featureType = FeatureTypeFromConfig(configMap);
  if(GetConfigValueAs<unsigned int>(configMap, "iterations",
                                    DEFAULT_ITERATIONS) == 0) {
    throw InvalidIterationCount("at least one iteration is required");
  }
  Dataset ds;
  ds.LoadDataset(data, target, featureType);
  IterativeRelief ranker(&ds, configMap);
  ranker.ComputeAttributeScores();
  return ranker.GetWeights();
}

WeightVector surf(const FeatureMatrix& data, const ClassVector& target,
                  FeatureType featureType) {
  CheckFeatureType(featureType);
  Dataset ds;
  ds.LoadDataset(data, target, featureType);
  SURF ranker(&ds);
  ranker.ComputeAttributeScores();
  return ranker.GetWeights();
}

WeightVector surfstar(const FeatureMatrix& data, const ClassVector& target,
                      FeatureType featureType) {
  CheckFeatureType(featureType);
  Dataset ds;
  ds.LoadDataset(data, target, featureType);
  SURFStar ranker(&ds);
  ranker.ComputeAttributeScores();
  return ranker.GetWeights();
}

WeightVector multisurf(const FeatureMatrix& data, const ClassVector& target,
                       FeatureType featureType) {
  CheckFeatureType(featureType);
  Dataset ds;
  ds.LoadDataset(data, target, featureType);
  MultiSURF ranker(&ds);
  ranker.ComputeAttributeScores();
  return ranker.GetWeights();
}

AttributeRanker* CreateRanker(string algorithm, Dataset* ds,
                              const ConfigMap& configMap) {
  string algorithmName = to_lower(trim(algorithm));
  if(algorithmName == "relieff") {
    return new ReliefF(ds, configMap);
  }
  if(algorithmName == "iterative-relief") {
    return new IterativeRelief(ds, configMap);
  }
  if(algorithmName == "surf") {
    return new SURF(ds);
  }
  if(algorithmName == "surfstar") {
    return new SURFStar(ds);
  }
  if(algorithmName == "multisurf") {
    return new MultiSURF(ds);
  }
  throw InvalidConfiguration("algorithm [" + algorithm + "] is not one of "
                             "relieff|iterative-relief|surf|surfstar|"
                             "multisurf");
}
