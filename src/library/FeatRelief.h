/**
 * \file FeatRelief.h
 *
 * \brief Common types, enums and helper functions for the Relief rankers.
 *
 * \version 1.0
 */

#ifndef FEATRELIEF_H
#define	FEATRELIEF_H

#include <cstdlib>
#include <climits>
#include <iostream>
#include <string>
#include <vector>
#include <map>

#include <boost/lexical_cast.hpp>
#include <boost/type_traits/is_unsigned.hpp>

#include "FeatReliefExceptions.h"

/// T Y P E D E F S

/// type of feature values, continuous or discrete levels stored as doubles
typedef double FeatureLevel;
/// type of instance class labels
typedef int ClassLevel;

/// one instance (row) of feature values
typedef std::vector<FeatureLevel> FeatureRow;
/// row-major sample matrix: instances x features
typedef std::vector<FeatureRow> FeatureMatrix;
/// class labels aligned with the sample matrix rows
typedef std::vector<ClassLevel> ClassVector;
/// feature weights, one per feature
typedef std::vector<double> WeightVector;

/// distance pair type: distance, instance index
typedef std::pair<double, unsigned int> DistancePair;
/// vector of distance pairs represents distances to nearest neighbors
typedef std::vector<DistancePair> DistancePairs;
/// distance pairs iterator
typedef DistancePairs::const_iterator DistancePairsIt;

/// attribute scores: score, feature name
typedef std::vector<std::pair<double, std::string> > AttributeScores;
/// attribute scores iterator
typedef AttributeScores::const_iterator AttributeScoresCIt;

/// Configuration map as an alternative to Boost::program_options
typedef std::map<std::string, std::string> ConfigMap;

/// C O N S T A N T S

/// Error codes.
const static int COMMAND_LINE_ERROR = EXIT_FAILURE;
const static int DATASET_LOAD_ERROR = EXIT_FAILURE;

/// return value for invalid index into features or instances
const static unsigned int INVALID_INDEX = UINT_MAX;
/// stored value for missing discrete class
const static ClassLevel MISSING_DISCRETE_CLASS_VALUE = INT_MIN;

/// default number of nearest neighbors for k_nearest ReliefF
const static unsigned int DEFAULT_K_NEAREST_NEIGHBORS = 10;
/// default rank decay constant for exp_rank ReliefF
const static double DEFAULT_EXP_RANK_SIGMA = 10.0;
/// default number of passes for Iterative Relief
const static unsigned int DEFAULT_ITERATIONS = 100;
/// default distance kernel width for Iterative Relief
const static double DEFAULT_KERNEL_WIDTH = 0.25;
/// default convergence tolerance (L1 change) for Iterative Relief
const static double DEFAULT_TOLERANCE = 1e-5;
/// default seed for the instance sampling random number generator
const static int DEFAULT_RANDOM_SEED = 1;

/// E N U M S

/**
 * \enum FeatureType.
 * Type of all features in a data set; one type per run.
 */
enum FeatureType
{
  CONTINUOUS_FEATURES, /**< continuous numeric features */
  DISCRETE_FEATURES /**< discrete categorical levels */
};

/**
 * \enum WeightUpdateMode.
 * ReliefF weight update policy.
 */
enum WeightUpdateMode
{
  K_NEAREST_UPDATE, /**< average over k nearest hits and misses */
  DIFF_UPDATE, /**< raw pairwise differences over all neighbors */
  EXP_RANK_UPDATE /**< exponential rank decay over all neighbors */
};

/**
 * \enum NeighborSearchMode.
 * How neighbors are retrieved for a query instance.
 */
enum NeighborSearchMode
{
  K_NEAREST_SEARCH, /**< k nearest hits and k nearest misses per class */
  FULL_RANKING_SEARCH /**< all other instances by ascending distance */
};

/***************************************************************************//**
 * Return a timestamp string for logging purposes.
 * \return fixed-length, formatted timestamp as a string
 ******************************************************************************/
std::string Timestamp();
/***************************************************************************//**
 * Get the parameter value from the configuration map key.
 * \param [in] configMap reference to a configuration map
 * \param [in] key parameter name
 * \param [out] parameter value
 * \return true if key found, false if not found
 ******************************************************************************/
bool GetConfigValue(const ConfigMap& configMap, std::string key,
                    std::string& value);
/***************************************************************************//**
 * Get a configuration value converted to T, or a default when the key is
 * absent. Throws InvalidConfiguration when the value cannot be converted
 * or a negative value is given for an unsigned type.
 * \param [in] configMap reference to a configuration map
 * \param [in] key parameter name
 * \param [in] defaultValue value returned for a missing key
 * \return converted value
 ******************************************************************************/
template <class T> T GetConfigValueAs(const ConfigMap& configMap,
                                      std::string key, T defaultValue) {
  std::string configValue;
  if(!GetConfigValue(configMap, key, configValue)) {
    return defaultValue;
  }
  // lexical_cast wraps negative values into unsigned types
  if(boost::is_unsigned<T>::value && (configValue[0] == '-')) {
    throw InvalidConfiguration(key + " = [" + configValue +
                               "] must not be negative");
  }
  try {
    return boost::lexical_cast<T>(configValue);
  } catch(const boost::bad_lexical_cast&) {
    throw InvalidConfiguration(key + " = [" + configValue + "]");
  }
}
/***************************************************************************//**
 * Parse a feature type name: "continuous" or "discrete", case insensitive.
 * Throws InvalidFeatureType for anything else.
 * \param [in] typeName feature type name
 * \return feature type
 ******************************************************************************/
FeatureType FeatureTypeFromString(std::string typeName);
/// Name of a feature type; throws InvalidFeatureType for unknown values.
std::string FeatureTypeName(FeatureType featureType);
/// Throw InvalidFeatureType unless featureType is a known enumerator.
void CheckFeatureType(FeatureType featureType);
/***************************************************************************//**
 * Parse a weight update mode name: "k_nearest", "diff" or "exp_rank".
 * Throws InvalidMode for anything else.
 * \param [in] modeName mode name
 * \return weight update mode
 ******************************************************************************/
WeightUpdateMode WeightUpdateModeFromString(std::string modeName);
/// Name of a weight update mode; throws InvalidMode for unknown values.
std::string WeightUpdateModeName(WeightUpdateMode mode);
/// Throw InvalidMode unless mode is a known enumerator.
void CheckWeightUpdateMode(WeightUpdateMode mode);

#endif	/* FEATRELIEF_H */
