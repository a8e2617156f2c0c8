/*
 * SURFStar.cpp
 */

#include <string>

#include "SURFStar.h"
#include "SURF.h"
#include "Dataset.h"

using namespace std;

SURFStar::SURFStar(Dataset* ds) : SURF(ds) {
}

SURFStar::~SURFStar() {
}

string SURFStar::Name() const {
  return "SURF*";
}

bool SURFStar::UseFarNeighbors() const {
  return true;
}
