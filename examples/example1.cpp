/**
 * \file example1.cpp
 *
 * Rank ten random continuous features when the class is (F0001 > F0002).
 *
 * Built by the top level CMakeLists.txt as featrelief_example1.
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "Dataset.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "GSLRandomFlat.h"
#include "ReliefF.h"

using namespace std;

/**
 * Load a synthetic data set, run ReliefF and print the two best features.
 */
int main(int argc, char** argv) {

  /// 500 instances of 10 uniform [0, 1) features
  GSLRandomFlat rng(42, 0.0, 1.0);
  FeatureMatrix data;
  ClassVector target;
  for(unsigned int i = 0; i < 500; ++i) {
    FeatureRow row;
    for(unsigned int j = 0; j < 10; ++j) {
      row.push_back(rng.nextRandVal());
    }
    target.push_back(row[0] > row[1] ? 1 : 0);
    data.push_back(row);
  }

  try {
    Dataset example1Dataset;
    example1Dataset.LoadDataset(data, target, CONTINUOUS_FEATURES);
    example1Dataset.PrintStats();

    /// exponential rank decay over all neighbors, sigma = 10
    ReliefF relieff(&example1Dataset, EXP_RANK_UPDATE);
    relieff.ComputeAttributeScores();
    relieff.PrintScores(cout);

    vector<unsigned int> best = relieff.SelectTopFeatures(2);
    cout << "Best two features:";
    for(unsigned int i = 0; i < best.size(); ++i) {
      cout << " " << example1Dataset.GetFeatureNames()[best[i]];
    }
    cout << endl;
  } catch(const FeatReliefException& e) {
    cerr << "ERROR: " << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  return 0;
}
