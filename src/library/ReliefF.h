/**
 * \class ReliefF
 *
 * \brief ReliefF attribute ranking algorithm.
 *
 * Every query instance (all instances, or m randomly sampled ones)
 * contributes a weight delta computed by the configured weight update
 * policy from its neighbors; the deltas are summed in instance order and
 * normalized.
 *
 * Marko Robnik-Sikonja, Igor Kononenko: Theoretical and Empirical Analysis of
 * ReliefF and RReliefF. Machine Learning Journal, 53:23-69, 2003
 *
 * \sa WeightUpdatePolicy
 *
 * \version 1.0
 */

#ifndef RELIEFF_H
#define RELIEFF_H

#include <vector>

#include <boost/scoped_ptr.hpp>

#include "AttributeRanker.h"
#include "Dataset.h"
#include "FeatRelief.h"
#include "WeightUpdatePolicy.h"

class ReliefF : public AttributeRanker
{
public:
  /*************************************************************************//**
   * Construct a ReliefF algorithm object.
   * Throws InvalidMode for an unknown mode and InvalidNeighborCount for
   * k = 0 or k >= N in k_nearest mode.
   * \param [in] ds pointer to a Dataset object
   * \param [in] mode weight update mode
   * \param [in] k number of nearest neighbors (k_nearest mode)
   * \param [in] expRankSigma rank decay constant (exp_rank mode)
   * \param [in] numRandomSamples m; 0 or N processes every instance
   * \param [in] randomSeed seed for instance sampling
   ****************************************************************************/
  ReliefF(Dataset* ds,
          WeightUpdateMode mode = K_NEAREST_UPDATE,
          unsigned int k = DEFAULT_K_NEAREST_NEIGHBORS,
          double expRankSigma = DEFAULT_EXP_RANK_SIGMA,
          unsigned int numRandomSamples = 0,
          unsigned long int randomSeed = DEFAULT_RANDOM_SEED);
  /*************************************************************************//**
   * Construct a ReliefF algorithm object.
   * Keys: mode, k-nearest-neighbors, exp-rank-sigma, number-random-samples,
   * random-seed.
   * \param [in] ds pointer to a Dataset object
   * \param [in] configMap reference to a ConfigMap (map<string, string>)
   ****************************************************************************/
  ReliefF(Dataset* ds, const ConfigMap& configMap);
  virtual ~ReliefF();
  /// Compute the ReliefF weights for all features.
  virtual bool ComputeAttributeScores();
  /// Compute the weights and return the (score, name) pairs.
  AttributeScores ComputeScores();
  /// Weight update mode in use.
  WeightUpdateMode GetMode() const;
  /// Number of nearest neighbors in k_nearest mode.
  unsigned int GetK() const;
  /// Number of query instances per run.
  unsigned int GetNumSamples() const;
protected:
  /// Check the options and create the weight update policy.
  void Initialize();
  /// Indices of the query instances for one run.
  std::vector<unsigned int> ChooseQueryInstances();

  /// weight update mode
  WeightUpdateMode updateMode;
  /// owned weight update policy
  boost::scoped_ptr<WeightUpdatePolicy> policy;
  /// number of instances to sample
  unsigned int m;
  /// are instances being randomly selected?
  bool randomlySelect;
  /// seed for random instance sampling
  unsigned long int seed;
  /// k nearest neighbors
  unsigned int k;
  /// sigma value used in exponential rank decay
  double weightByDistanceSigma;
};

#endif
