/**
 * \class AttributeRanker
 *
 * \brief Abstract base class for the Relief family attribute rankers.
 *
 * Holds the weight vector of the last ComputeScores() call and derives the
 * (score, feature name) pairs, the ordinal ranking and the top n feature
 * selection from it.
 *
 * \version 1.0
 */

#ifndef ATTRIBUTERANKER_H
#define ATTRIBUTERANKER_H

#include <iostream>
#include <string>
#include <vector>

#include "Dataset.h"
#include "FeatRelief.h"

class AttributeRanker
{
public:
  /// Construct a ranker working on a loaded data set.
  AttributeRanker(Dataset* ds);
  /// Destruct all dynamically allocated memory.
  virtual ~AttributeRanker();

  /// Compute the attribute scores for the current set of attributes.
  virtual AttributeScores ComputeScores() = 0;
  /*************************************************************************//**
   * Get the (importance) scores as a vector of pairs: score, attribute name
   * in original column order.
   * \return vector of pairs
   ****************************************************************************/
  virtual AttributeScores GetScores();
  /// Get the weights of the last ComputeScores() call, one per feature.
  WeightVector GetWeights() const;
	/*************************************************************************//**
	 * Ordinal rank of each feature: 1 for the highest weight, ties broken
	 * by column order.
	 * \return M ranks in original column order
	 ****************************************************************************/
	std::vector<unsigned int> GetRanking() const;
	/*************************************************************************//**
	 * Indices of the n best ranked features in original column order.
	 * All features are selected when n >= M.
	 * \param [in] n number of features to select
	 * \return selected column indices, ascending
	 ****************************************************************************/
	std::vector<unsigned int> SelectTopFeatures(unsigned int n) const;
	/*************************************************************************//**
	 * Write the scores and attribute names to stream, best first.
	 * \param [in] outStream stream to write score-attribute name pairs
	 * \param [in] numToPrint print only the best n, 0 for all
	 ****************************************************************************/
	virtual void PrintScores(std::ostream& outStream=std::cout,
			unsigned int numToPrint=0);
protected:
  /// Store the final weights and pair them with the feature names.
  void SetWeights(const WeightVector& weights);
  /// feature indices ordered best first
  std::vector<unsigned int> RankedIndices() const;

  /// The Dataset on which the ranking algorithm is working.
  Dataset* dataset;
  /// attribute weights
  WeightVector W;
  /// attribute scores and names
  AttributeScores scores;
  /// have weights been computed?
  bool haveScores;
};

/*****************************************************************************//**
 * Reduce a sample matrix to a subset of its columns.
 * \param [in] dataMatrix rows = instances, columns = features
 * \param [in] columns column indices to keep, in output order
 * \return reduced matrix
 ******************************************************************************/
FeatureMatrix SelectFeatureColumns(const FeatureMatrix& dataMatrix,
                                   const std::vector<unsigned int>& columns);

#endif
