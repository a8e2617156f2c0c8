/**
 * \class WeightUpdatePolicy
 *
 * \brief Abstract base class for the ReliefF weight update strategies.
 *
 * A policy turns the neighbor set of one query instance into a weight
 * delta, one value per feature, and names the divisor ReliefF applies to
 * the summed deltas. The three strategies are mutually exclusive and
 * selected by the ReliefF "mode" option:
 *
 * - k_nearest: minus the average diff to the k nearest hits plus, for every
 *   other class C, P(C) / (1 - P(class of R)) times the average diff to the
 *   k nearest misses of class C.
 * - diff: +diff for every miss, -diff for every hit, over all instances.
 * - exp_rank: same sign convention over all instances, each neighbor
 *   weighted by exp(-(rank / sigma)^2) of its rank within its group, the
 *   factors of a group normalized to sum to 1.
 *
 * \version 1.0
 */

#ifndef WEIGHTUPDATEPOLICY_H
#define WEIGHTUPDATEPOLICY_H

#include <vector>
#include <map>

#include "FeatRelief.h"
#include "Dataset.h"
#include "DistanceMetrics.h"
#include "NeighborSearch.h"

class WeightUpdatePolicy
{
public:
  /*************************************************************************//**
   * Construct a weight update policy.
   * \param [in] ds pointer to the data set being ranked
   * \param [in] diffFunction per-feature diff function
   ****************************************************************************/
  WeightUpdatePolicy(Dataset* ds, DiffFunction diffFunction);
  virtual ~WeightUpdatePolicy();
  /// The update mode implemented by this policy.
  virtual WeightUpdateMode GetMode() const = 0;
  /// How neighbors must be retrieved for this policy.
  virtual NeighborSearchMode GetSearchMode() const = 0;
  /*************************************************************************//**
   * Compute the weight delta contributed by one query instance.
   * \param [in] queryIndex index of the query instance R
   * \param [in] neighbors neighbors of R as returned by NeighborSearch
   * \param [out] delta per-feature weight delta, resized to M
   ****************************************************************************/
  virtual void ComputeDelta(unsigned int queryIndex,
                            const NeighborSet& neighbors,
                            WeightVector& delta) const = 0;
  /*************************************************************************//**
   * Factor applied to the summed deltas after m query instances.
   * \param [in] m number of processed query instances
   * \return normalizing factor
   ****************************************************************************/
  virtual double NormalizingFactor(unsigned int m) const = 0;
protected:
  /// neighbor indices split into hits and misses by class, in input order
  struct NeighborGroups
  {
    std::vector<unsigned int> hits;
    std::map<ClassLevel, std::vector<unsigned int> > misses;
  };
  /// split a neighbor set into hits and misses by class
  NeighborGroups GroupNeighbors(const NeighborSet& neighbors) const;
  /// P(C) / (1 - P(class of R)) class prior adjustment for misses of C
  double MissAdjustment(ClassLevel missClass, ClassLevel queryClass) const;
  /*************************************************************************//**
   * Add factor * diff(R, neighbor) to delta for every feature.
   * \param [in] queryIndex index of R
   * \param [in] neighborIndex index of the neighbor
   * \param [in] factor multiplier, negative for hits
   * \param [in,out] delta per-feature weight delta
   ****************************************************************************/
  void AddScaledDiffs(unsigned int queryIndex, unsigned int neighborIndex,
                      double factor, WeightVector& delta) const;

  /// the data set being ranked
  Dataset* dataset;
  /// per-feature diff function
  DiffFunction diffFunc;
};

/// k_nearest: class-prior weighted average over k nearest hits and misses
class KNearestWeightUpdate : public WeightUpdatePolicy
{
public:
  KNearestWeightUpdate(Dataset* ds, DiffFunction diffFunction);
  WeightUpdateMode GetMode() const;
  NeighborSearchMode GetSearchMode() const;
  void ComputeDelta(unsigned int queryIndex, const NeighborSet& neighbors,
                    WeightVector& delta) const;
  double NormalizingFactor(unsigned int m) const;
};

/// diff: raw signed pairwise differences over all other instances
class DiffWeightUpdate : public WeightUpdatePolicy
{
public:
  DiffWeightUpdate(Dataset* ds, DiffFunction diffFunction);
  WeightUpdateMode GetMode() const;
  NeighborSearchMode GetSearchMode() const;
  void ComputeDelta(unsigned int queryIndex, const NeighborSet& neighbors,
                    WeightVector& delta) const;
  double NormalizingFactor(unsigned int m) const;
};

/// exp_rank: exponential rank decay over all other instances
class ExpRankWeightUpdate : public WeightUpdatePolicy
{
public:
  /*************************************************************************//**
   * Construct an exponential rank weight update.
   * \param [in] ds pointer to the data set being ranked
   * \param [in] diffFunction per-feature diff function
   * \param [in] rankSigma rank decay constant, > 0
   ****************************************************************************/
  ExpRankWeightUpdate(Dataset* ds, DiffFunction diffFunction,
                      double rankSigma);
  WeightUpdateMode GetMode() const;
  NeighborSearchMode GetSearchMode() const;
  void ComputeDelta(unsigned int queryIndex, const NeighborSet& neighbors,
                    WeightVector& delta) const;
  double NormalizingFactor(unsigned int m) const;
  /*************************************************************************//**
   * Rank influence factors exp(-(rank / sigma)^2) for ranks 1..n,
   * normalized to sum to 1.
   * \param [in] n number of neighbors in the group
   * \return n factors, largest first
   ****************************************************************************/
  std::vector<double> RankInfluenceFactors(unsigned int n) const;
private:
  /// rank decay constant
  double sigma;
};

/*****************************************************************************//**
 * Create the weight update policy for a mode.
 * Throws InvalidMode for an unknown mode.
 * \param [in] mode weight update mode
 * \param [in] ds pointer to the data set being ranked
 * \param [in] diffFunction per-feature diff function
 * \param [in] rankSigma rank decay constant for exp_rank
 * \return new policy object owned by the caller
 ******************************************************************************/
WeightUpdatePolicy* CreateWeightUpdatePolicy(WeightUpdateMode mode,
                                             Dataset* ds,
                                             DiffFunction diffFunction,
                                             double rankSigma =
                                               DEFAULT_EXP_RANK_SIGMA);

#endif
