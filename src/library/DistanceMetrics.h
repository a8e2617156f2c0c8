/**
 * \file DistanceMetrics.h
 *
 * \brief Per-feature difference functions and instance-to-instance
 * distances for the Relief rankers.
 *
 * \version 1.0
 */

#ifndef DISTANCEMETRICS_H
#define	DISTANCEMETRICS_H

#include <vector>

#include "FeatRelief.h"

/// Forward reference to a DatasetInstance class.
class DatasetInstance;

/// per-feature difference function: feature index, instance 1, instance 2
typedef double (*DiffFunction)(unsigned int featureIndex,
                               DatasetInstance* dsi1,
                               DatasetInstance* dsi2);

/***************************************************************************//**
 * Discrete level mismatch metric.
 * \param [in] featureIndex index into the vector of features
 * \param [in] dsi1 data set instance 1
 * \param [in] dsi2 data set instance 2
 * \return diff(erence) between feature values: 0.0 (same) or 1.0 (not same)
 ****************************************************************************/
double diffMismatch(unsigned int featureIndex,
                    DatasetInstance* dsi1,
                    DatasetInstance* dsi2);
/***************************************************************************//**
 * "Manhattan" distance between continuous features.
 * \param [in] featureIndex index into the vector of features
 * \param [in] dsi1 data set instance 1
 * \param [in] dsi2 data set instance 2
 * \return absolute value of difference divided by feature's range
 ******************************************************************************/
double diffManhattan(unsigned int featureIndex,
                     DatasetInstance* dsi1,
                     DatasetInstance* dsi2);
/***************************************************************************//**
 * Select the diff function for a feature type.
 * Throws InvalidFeatureType for an unknown type.
 * \param [in] featureType continuous or discrete
 * \return diff function pointer
 ******************************************************************************/
DiffFunction ChooseDiffFunction(FeatureType featureType);
/***************************************************************************//**
 * Compute the diff of every feature between two instances.
 * \param [in] diffFunc per-feature diff function
 * \param [in] dsi1 data set instance 1
 * \param [in] dsi2 data set instance 2
 * \param [out] diffs M non-negative per-feature differences
 ******************************************************************************/
void ComputeFeatureDiffs(DiffFunction diffFunc,
                         DatasetInstance* dsi1,
                         DatasetInstance* dsi2,
                         std::vector<double>& diffs);
/***************************************************************************//**
 * Aggregate distance between two instances: the sum of the per-feature
 * diffs, each multiplied by its feature weight when weights are given.
 * \param [in] diffFunc per-feature diff function
 * \param [in] dsi1 data set instance 1
 * \param [in] dsi2 data set instance 2
 * \param [in] featureWeights optional feature weights, NULL for uniform
 * \return distance
 ******************************************************************************/
double ComputeInstanceDistance(DiffFunction diffFunc,
                               DatasetInstance* dsi1,
                               DatasetInstance* dsi2,
                               const WeightVector* featureWeights = NULL);

#endif	/* DISTANCEMETRICS_H */
