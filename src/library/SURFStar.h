/**
 * \class SURFStar
 *
 * \brief SURF*: SURF plus the far instances (distance above the mean
 * pairwise distance), which contribute with the opposite sign: far hits
 * raise a feature's weight, far misses lower it.
 *
 * Casey S. Greene et al., Enabling personal genomics with an explicit test
 * of epistasis. Pacific Symposium on Biocomputing, 2010
 *
 * \version 1.0
 */

#ifndef SURFSTAR_H
#define SURFSTAR_H

#include <string>

#include "SURF.h"
#include "Dataset.h"

class SURFStar : public SURF
{
public:
  SURFStar(Dataset* ds);
  virtual ~SURFStar();
protected:
  std::string Name() const;
  bool UseFarNeighbors() const;
};

#endif
