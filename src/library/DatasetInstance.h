/**
 * \class DatasetInstance
 *
 * \brief Class to hold one data set instance (a row of feature values) and
 * its class label.
 *
 * \version 1.0
 */

#ifndef DATASET_INSTANCE_H
#define DATASET_INSTANCE_H

#include <iostream>
#include <vector>

#include "FeatRelief.h"

/// forward reference to avoid circular include problems
class Dataset;

class DatasetInstance
{
public:
  /*************************************************************************//**
   * Construct a data set instance object.
   * \param [in] ds pointer to the owning Dataset object
   * \param [in] index row index of this instance in the data set
   ****************************************************************************/
  DatasetInstance(Dataset* ds, unsigned int index);
  ~DatasetInstance();
  /// return the Dataset pointer associated with this instance
  Dataset* GetDatasetPtr();
  /// return the row index of this instance in the data set
  unsigned int GetIndex() const;
  /*************************************************************************//**
   * Load this instance with the feature values from the newValues vector.
   * \param [in] newValues vector of new feature values
   * \return success
   ****************************************************************************/
  bool LoadInstanceFromVector(const FeatureRow& newValues);
  /// return the number of features
  unsigned int NumFeatures() const;
  /*************************************************************************//**
   * Get and return a feature value at index.
   * \param [in] index feature index
   * \return feature value at index
   ****************************************************************************/
  FeatureLevel GetFeature(unsigned int index) const;
  /// Get the discrete class value.
  ClassLevel GetClass() const;
  /// Set the discrete class value.
  void SetClass(ClassLevel classValue);
  /// Print the features and class of this instance
  void Print(std::ostream& outStream=std::cout) const;
  /// feature values
  FeatureRow features;
private:
  /// pointer to a Dataset object
  Dataset* dataset;
  /// row index in the owning data set
  unsigned int instanceIndex;
  /// the class value for this instance
  ClassLevel classLabel;
};

#endif
