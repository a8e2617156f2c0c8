/**
 * \class MultiSURF
 *
 * \brief MultiSURF: SURF with a threshold per instance,
 * T_i = mean_i - stddev_i / 2 of the distances from instance i to all
 * other instances.
 *
 * Ryan Urbanowicz et al., Benchmarking Relief-based feature selection
 * methods for bioinformatics data mining. Journal of Biomedical
 * Informatics 85, 2018
 *
 * \version 1.0
 */

#ifndef MULTISURF_H
#define MULTISURF_H

#include <string>

#include "SURF.h"
#include "Dataset.h"
#include "NeighborSearch.h"

class MultiSURF : public SURF
{
public:
  MultiSURF(Dataset* ds);
  virtual ~MultiSURF();
protected:
  std::string Name() const;
  void PrepareThresholds(const NeighborSearch& neighborSearch);
  double NearThreshold(const NeighborSearch& neighborSearch,
                       unsigned int queryIndex) const;
};

#endif
