/**
 * \file ReliefFunctions.h
 *
 * \brief Function-level interface to the Relief family rankers: plain
 * sample matrix and class vector in, one weight per feature out.
 *
 * Every function checks the feature type (and the ReliefF mode) before it
 * touches the data, so a bad type fails even on an empty matrix.
 *
 * \version 1.0
 */

#ifndef RELIEFFUNCTIONS_H
#define RELIEFFUNCTIONS_H

#include <string>

#include "FeatRelief.h"
#include "AttributeRanker.h"
#include "Dataset.h"

/***************************************************************************//**
 * ReliefF feature weights.
 * \param [in] data rows = instances, columns = features
 * \param [in] target class label per row
 * \param [in] featureType type of all features, no default
 * \param [in] mode weight update mode
 * \param [in] k number of nearest neighbors (k_nearest mode)
 * \return weights in [-1, 1], one per feature
 ******************************************************************************/
WeightVector relieff(const FeatureMatrix& data, const ClassVector& target,
                     FeatureType featureType,
                     WeightUpdateMode mode = K_NEAREST_UPDATE,
                     unsigned int k = DEFAULT_K_NEAREST_NEIGHBORS);
/// ReliefF configured by name: f-type (required), mode, k-nearest-neighbors,
/// exp-rank-sigma, number-random-samples, random-seed.
WeightVector relieff(const FeatureMatrix& data, const ClassVector& target,
                     const ConfigMap& configMap);
/***************************************************************************//**
 * Iterative Relief feature weights.
 * \param [in] data rows = instances, columns = features
 * \param [in] target class label per row
 * \param [in] featureType type of all features
 * \param [in] iterations maximum number of passes
 * \return non-negative weights summing to 1, one per feature
 ******************************************************************************/
WeightVector iterative_relief(const FeatureMatrix& data,
                              const ClassVector& target,
                              FeatureType featureType,
                              unsigned int iterations = DEFAULT_ITERATIONS);
/// Iterative Relief configured by name: f-type (required), iterations,
/// kernel-width, tolerance.
WeightVector iterative_relief(const FeatureMatrix& data,
                              const ClassVector& target,
                              const ConfigMap& configMap);
/// SURF feature weights.
WeightVector surf(const FeatureMatrix& data, const ClassVector& target,
                  FeatureType featureType);
/// SURF* feature weights.
WeightVector surfstar(const FeatureMatrix& data, const ClassVector& target,
                      FeatureType featureType);
/// MultiSURF feature weights.
WeightVector multisurf(const FeatureMatrix& data, const ClassVector& target,
                       FeatureType featureType);
/***************************************************************************//**
 * Create a ranker by algorithm name: relieff, iterative-relief, surf,
 * surfstar or multisurf. Throws InvalidConfiguration for other names.
 * \param [in] algorithm algorithm name
 * \param [in] ds pointer to a loaded Dataset object
 * \param [in] configMap algorithm options
 * \return new ranker owned by the caller
 ******************************************************************************/
AttributeRanker* CreateRanker(std::string algorithm, Dataset* ds,
                              const ConfigMap& configMap);
/// Feature type from the required f-type key; throws InvalidFeatureType.
FeatureType FeatureTypeFromConfig(const ConfigMap& configMap);

#endif
