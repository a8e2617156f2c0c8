/**
 * \class NeighborSearch
 *
 * \brief Instance-to-instance distance matrix and neighbor retrieval for the
 * Relief rankers.
 *
 * The distance matrix is computed once per pass, optionally weighting each
 * feature diff, and then queried for the k nearest hits and misses of an
 * instance, for a full ranking of all other instances, or for the
 * instances closer (or farther) than a distance threshold.
 *
 * \version 1.0
 */

#ifndef NEIGHBORSEARCH_H
#define NEIGHBORSEARCH_H

#include <vector>
#include <utility>

#include "FeatRelief.h"
#include "Dataset.h"
#include "DistanceMetrics.h"

/**
 * \struct Neighbor
 * One other instance as seen from a query instance.
 */
struct Neighbor
{
  /// index of the neighbor in the data set
  unsigned int index;
  /// aggregate distance to the query instance
  double distance;
  /// does the neighbor share the query instance's class?
  bool isHit;
  /// class label of the neighbor
  ClassLevel classLabel;
};

/// neighbors of one query instance, hits and misses in distance order
typedef std::vector<Neighbor> NeighborSet;
/// neighbor set iterator
typedef NeighborSet::const_iterator NeighborSetCIt;

class NeighborSearch
{
public:
  /*************************************************************************//**
   * Construct a neighbor search over a data set.
   * \param [in] ds pointer to a loaded Dataset object
   ****************************************************************************/
  NeighborSearch(Dataset* ds);
  virtual ~NeighborSearch();
  /*************************************************************************//**
   * Precompute all pairwise instance-to-instance distances.
   * \param [in] featureWeights optional feature weights, NULL for uniform
   * \return success
   ****************************************************************************/
  bool PreComputeDistances(const WeightVector* featureWeights = NULL);
  /// Distance between instances i and j from the precomputed matrix.
  double GetDistance(unsigned int i, unsigned int j) const;
  /*************************************************************************//**
   * Find the neighbors of a query instance.
   * K_NEAREST_SEARCH returns the k nearest hits followed by the k nearest
   * misses of every other class (ascending class label); groups with fewer
   * than k members return all of them. FULL_RANKING_SEARCH returns every
   * other instance. Within a group neighbors are ordered by ascending
   * distance, ties by instance index. Throws InvalidNeighborCount when k is
   * 0 or not smaller than the number of instances in K_NEAREST_SEARCH mode.
   * \param [in] queryIndex query instance index
   * \param [in] mode search mode
   * \param [in] k number of nearest neighbors per group
   * \return neighbor set
   ****************************************************************************/
  NeighborSet FindNeighbors(unsigned int queryIndex,
                            NeighborSearchMode mode,
                            unsigned int k = 0) const;
  /// All other instances with distance strictly below threshold.
  NeighborSet FindNeighborsWithin(unsigned int queryIndex,
                                  double threshold) const;
  /// All other instances with distance strictly above threshold.
  NeighborSet FindNeighborsBeyond(unsigned int queryIndex,
                                  double threshold) const;
  /// Mean of all N * (N - 1) / 2 pairwise distances.
  double MeanPairwiseDistance() const;
  /*************************************************************************//**
   * Mean and (population) standard deviation of the distances from one
   * instance to all other instances.
   * \param [in] queryIndex query instance index
   * \return pair: mean, standard deviation
   ****************************************************************************/
  std::pair<double, double> InstanceDistanceStats(unsigned int queryIndex) const;
  /// The diff function chosen for the data set's feature type.
  DiffFunction GetDiffFunction() const;
  /// Check k for K_NEAREST_SEARCH; throws InvalidNeighborCount.
  static void CheckNeighborCount(unsigned int k, unsigned int numInstances);
private:
  NeighborSearch(const NeighborSearch& other);
  NeighborSearch& operator=(const NeighborSearch& other);
  /// make a Neighbor record for instance j seen from instance i
  Neighbor MakeNeighbor(unsigned int i, unsigned int j) const;
  /// append the sorted distance pairs as neighbors
  void AppendNeighbors(unsigned int queryIndex, DistancePairs& pairs,
                       NeighborSet& neighbors) const;

  /// the data set being searched
  Dataset* dataset;
  /// per-feature diff function for the data set's feature type
  DiffFunction diffFunc;
  /// symmetric N x N distance matrix
  std::vector<std::vector<double> > distanceMatrix;
  /// has the matrix been computed?
  bool haveDistances;
};

#endif
