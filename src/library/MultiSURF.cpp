/*
 * MultiSURF.cpp
 */

#include <iostream>
#include <string>
#include <utility>

#include "MultiSURF.h"
#include "SURF.h"
#include "Dataset.h"
#include "NeighborSearch.h"
#include "FeatRelief.h"

using namespace std;

MultiSURF::MultiSURF(Dataset* ds) : SURF(ds) {
}

MultiSURF::~MultiSURF() {
}

string MultiSURF::Name() const {
  return "MultiSURF";
}

void MultiSURF::PrepareThresholds(const NeighborSearch& neighborSearch) {
  cout << Timestamp() << "Using per-instance thresholds: mean - std / 2"
          << endl;
}

double MultiSURF::NearThreshold(const NeighborSearch& neighborSearch,
                                unsigned int queryIndex) const {
  pair<double, double> meanStd =
          neighborSearch.InstanceDistanceStats(queryIndex);
  return meanStd.first - meanStd.second / 2.0;
}
