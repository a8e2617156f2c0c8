/**
 * \class IterativeRelief
 *
 * \brief Iterative Relief: re-estimates the distance metric across passes.
 *
 * The state is the current feature weight vector, starting uniform 1/M.
 * One pass computes the distance matrix weighted by the current state and,
 * for every instance, gives each hit and each miss the kernel factor
 * exp(-(d - d_min) / kernelWidth), normalized within the hits and within
 * the misses. The instance contributes sum(miss factor * diff) minus
 * sum(hit factor * diff). The summed estimate, clipped at zero and scaled
 * to sum to 1, is the next state. Passes stop after the maximum number of passes or
 * when the L1 change between states falls below the tolerance.
 *
 * Y. Sun, Iterative RELIEF for Feature Weighting: Algorithms, Theories,
 * and Applications. IEEE TPAMI 29(6), 2007
 *
 * \version 1.0
 */

#ifndef ITERATIVERELIEF_H
#define ITERATIVERELIEF_H

#include <vector>

#include "AttributeRanker.h"
#include "Dataset.h"
#include "FeatRelief.h"
#include "NeighborSearch.h"

class IterativeRelief : public AttributeRanker
{
public:
  /*************************************************************************//**
   * Construct an Iterative Relief algorithm object.
   * Throws InvalidIterationCount for zero iterations and
   * InvalidConfiguration for a non-positive kernel width or a negative
   * tolerance.
   * \param [in] ds pointer to a Dataset object
   * \param [in] maxIterations maximum number of passes
   * \param [in] kernelWidth distance kernel width
   * \param [in] convergenceTolerance L1 change that stops the passes
   ****************************************************************************/
  IterativeRelief(Dataset* ds,
                  unsigned int maxIterations = DEFAULT_ITERATIONS,
                  double kernelWidth = DEFAULT_KERNEL_WIDTH,
                  double convergenceTolerance = DEFAULT_TOLERANCE);
  /*************************************************************************//**
   * Construct an Iterative Relief algorithm object.
   * Keys: iterations, kernel-width, tolerance.
   * \param [in] ds pointer to a Dataset object
   * \param [in] configMap reference to a ConfigMap (map<string, string>)
   ****************************************************************************/
  IterativeRelief(Dataset* ds, const ConfigMap& configMap);
  virtual ~IterativeRelief();
  /// Run the passes and store the terminal weights.
  bool ComputeAttributeScores();
  /// Compute the weights and return the (score, name) pairs.
  AttributeScores ComputeScores();
  /// State before the first pass followed by the state after every pass.
  std::vector<WeightVector> GetWeightHistory() const;
  /// L1 change between successive states, one per pass.
  std::vector<double> GetChangeHistory() const;
  /// Number of passes of the last run.
  unsigned int GetIterationsRun() const;
  /// Did the last run stop on the tolerance?
  bool Converged() const;
private:
  /// Check the options and log the configuration.
  void Initialize();
  /*************************************************************************//**
   * One pass: the next state from the current state.
   * \param [in] currentWeights current metric weights
   * \param [out] nextWeights next metric weights
   ****************************************************************************/
  void RunPass(const WeightVector& currentWeights, WeightVector& nextWeights);
  /*************************************************************************//**
   * Add the kernel weighted diffs of one neighbor group to delta.
   * \param [in] queryIndex index of the query instance
   * \param [in] group neighbors of one group (hits or misses)
   * \param [in] sign +1 for misses, -1 for hits
   * \param [in,out] delta per-feature weight delta
   ****************************************************************************/
  void AddKernelDiffs(unsigned int queryIndex, const NeighborSet& group,
                      double sign, WeightVector& delta) const;

  /// maximum number of passes
  unsigned int iterations;
  /// distance kernel width
  double sigma;
  /// L1 change tolerance
  double tolerance;
  /// per-feature diff function
  DiffFunction diffFunc;
  /// states of the last run
  std::vector<WeightVector> weightHistory;
  /// L1 changes of the last run
  std::vector<double> changeHistory;
  /// did the last run converge?
  bool converged;
};

#endif
