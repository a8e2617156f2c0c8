/*
 * File:   DistanceMetrics.cpp
 *
 * Per-feature diff functions for continuous and discrete features.
 */

#include <cmath>
#include <vector>
#include <utility>

#include <boost/lexical_cast.hpp>

#include "Dataset.h"
#include "DatasetInstance.h"
#include "DistanceMetrics.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"

using namespace std;

double diffMismatch(unsigned int featureIndex,
                    DatasetInstance* dsi1,
                    DatasetInstance* dsi2) {
  return (dsi1->features[featureIndex] !=
          dsi2->features[featureIndex]) ? 1.0 : 0.0;
}

double diffManhattan(unsigned int featureIndex,
                     DatasetInstance* dsi1,
                     DatasetInstance* dsi2) {
  // range is 1 for a constant feature, so the diff is 0 there
  double range = dsi1->GetDatasetPtr()->GetRangeForFeature(featureIndex);
  return fabs(dsi1->features[featureIndex] -
              dsi2->features[featureIndex]) / range;
}

DiffFunction ChooseDiffFunction(FeatureType featureType) {
  switch(featureType) {
    case CONTINUOUS_FEATURES:
      return diffManhattan;
    case DISCRETE_FEATURES:
      return diffMismatch;
  }
  throw InvalidFeatureType("no diff function for feature type value " +
                           boost::lexical_cast<string>((int) featureType));
}

void ComputeFeatureDiffs(DiffFunction diffFunc,
                         DatasetInstance* dsi1,
                         DatasetInstance* dsi2,
                         vector<double>& diffs) {
  unsigned int numFeatures = dsi1->NumFeatures();
  diffs.resize(numFeatures);
  for(unsigned int j = 0; j < numFeatures; ++j) {
    diffs[j] = diffFunc(j, dsi1, dsi2);
  }
}

double ComputeInstanceDistance(DiffFunction diffFunc,
                               DatasetInstance* dsi1,
                               DatasetInstance* dsi2,
                               const WeightVector* featureWeights) {
  double distance = 0.0;
  unsigned int numFeatures = dsi1->NumFeatures();
  if(featureWeights) {
    for(unsigned int j = 0; j < numFeatures; ++j) {
      distance += (*featureWeights)[j] * diffFunc(j, dsi1, dsi2);
    }
  } else {
    for(unsigned int j = 0; j < numFeatures; ++j) {
      distance += diffFunc(j, dsi1, dsi2);
    }
  }
  return distance;
}
