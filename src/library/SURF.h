/**
 * \class SURF
 *
 * \brief SURF attribute ranking algorithm: Relief with a distance
 * threshold neighborhood instead of k nearest neighbors.
 *
 * The threshold T is the mean of all pairwise distances. Every instance
 * closer than T is a near neighbor; an instance contributes the mean diff
 * to its near misses minus the mean diff to its near hits. The summed
 * contributions are divided by N.
 *
 * Casey S. Greene et al., Spatially Uniform ReliefF (SURF) for
 * computationally-efficient filtering of gene-gene interactions.
 * BioData Mining 2:5, 2009
 *
 * \sa SURFStar, MultiSURF
 *
 * \version 1.0
 */

#ifndef SURF_H
#define SURF_H

#include <vector>

#include "AttributeRanker.h"
#include "Dataset.h"
#include "DistanceMetrics.h"
#include "FeatRelief.h"
#include "NeighborSearch.h"

class SURF : public AttributeRanker
{
public:
  /// Construct a SURF algorithm object on a loaded data set.
  SURF(Dataset* ds);
  virtual ~SURF();
  /// Compute the weights for all features.
  bool ComputeAttributeScores();
  /// Compute the weights and return the (score, name) pairs.
  AttributeScores ComputeScores();
protected:
  /// Name for log messages.
  virtual std::string Name() const;
  /// Compute data set wide thresholds once the distances are known.
  virtual void PrepareThresholds(const NeighborSearch& neighborSearch);
  /// Near neighbor threshold for one instance.
  virtual double NearThreshold(const NeighborSearch& neighborSearch,
                               unsigned int queryIndex) const;
  /// Do far instances contribute with the opposite sign?
  virtual bool UseFarNeighbors() const;
  /*************************************************************************//**
   * Add sign times the mean diff to the hits (or the misses) of a
   * neighbor set to delta.
   * \param [in] queryIndex index of the query instance
   * \param [in] neighbors neighbor set
   * \param [in] hits use the hits (true) or the misses (false)
   * \param [in] sign +1 or -1
   * \param [in,out] delta per-feature weight delta
   ****************************************************************************/
  void AddMeanDiffs(unsigned int queryIndex, const NeighborSet& neighbors,
                    bool hits, double sign, WeightVector& delta) const;

  /// per-feature diff function
  DiffFunction diffFunc;
  /// mean of all pairwise distances
  double meanDistance;
};

#endif
