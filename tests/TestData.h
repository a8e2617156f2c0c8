/**
 * \file TestData.h
 *
 * \brief Synthetic data sets for the ranker tests.
 */

#ifndef TESTDATA_H
#define TESTDATA_H

#include <vector>

#include "FeatRelief.h"
#include "GSLRandomFlat.h"

/***************************************************************************//**
 * Random features with class = (feature a > feature b).
 * Continuous features are uniform [0, 1); discrete features are uniform
 * levels 0, 1, 2, 3.
 * \param [in] numInstances N
 * \param [in] numFeatures M
 * \param [in] featureType continuous or discrete
 * \param [in] a first relevant feature
 * \param [in] b second relevant feature
 * \param [in] seed generator seed
 * \param [out] data N x M sample matrix
 * \param [out] target class labels 0/1
 ******************************************************************************/
inline void MakeComparisonData(unsigned int numInstances,
                               unsigned int numFeatures,
                               FeatureType featureType,
                               unsigned int a, unsigned int b,
                               unsigned long int seed,
                               FeatureMatrix& data, ClassVector& target) {
  GSLRandomFlat flat(seed, 0.0, 1.0);
  GSLRandomUniformInt levels(seed, 4);
  data.clear();
  target.clear();
  for(unsigned int i = 0; i < numInstances; ++i) {
    FeatureRow row;
    for(unsigned int j = 0; j < numFeatures; ++j) {
      if(featureType == CONTINUOUS_FEATURES) {
        row.push_back(flat.nextRandVal());
      } else {
        row.push_back(levels.nextRandVal());
      }
    }
    target.push_back(row[a] > row[b] ? 1 : 0);
    data.push_back(row);
  }
}

/// feature pairs checked by the discrimination tests
const static unsigned int NUM_TEST_PAIRS = 3;
const static unsigned int TEST_PAIRS[NUM_TEST_PAIRS][2] = {
  { 0, 1 }, { 2, 7 }, { 4, 9 }
};

/// Do features a and b weigh at least as much as every other feature?
inline bool RelevantFeaturesLead(const WeightVector& weights,
                                 unsigned int a, unsigned int b) {
  for(unsigned int j = 0; j < weights.size(); ++j) {
    if(j == a || j == b) {
      continue;
    }
    if(weights[a] < weights[j] || weights[b] < weights[j]) {
      return false;
    }
  }
  return true;
}

#endif
