/**
 * \class Dataset
 *
 * \brief Collection class holding DatasetInstances: an immutable N x M
 * sample matrix with one class label per row and one feature type for all
 * columns.
 *
 * Loaded either from in-memory matrices or from a whitespace-delimited text
 * file whose first line names the features and whose "class" column holds
 * the class labels.
 *
 * \version 1.0
 */

#ifndef DATASET_H
#define DATASET_H

#include <iostream>
#include <string>
#include <vector>
#include <map>

#include "FeatRelief.h"
#include "DatasetInstance.h"

class Dataset
{
public:
  /// Construct an empty data set.
  Dataset();
  /// Destruct all dynamically allocated memory.
  virtual ~Dataset();
  /*************************************************************************//**
   * Load the data set from a sample matrix and class vector.
   * Throws InvalidDataset when N < 2, M < 1, rows are ragged or the target
   * length does not match the number of rows.
   * \param [in] dataMatrix rows = instances, columns = features
   * \param [in] classLabels class label of each row
   * \param [in] featureType type of all features
   * \param [in] featureNames optional names; defaults to F0001, F0002, ...
   * \return success
   ****************************************************************************/
  bool LoadDataset(const FeatureMatrix& dataMatrix,
                   const ClassVector& classLabels,
                   FeatureType featureType,
                   const std::vector<std::string>& featureNames =
                     std::vector<std::string>());
  /*************************************************************************//**
   * Load the data set from a whitespace-delimited text file. The header row
   * names the features; the column named "class" (any case, any position)
   * holds integer class labels. Throws InvalidDataset on read errors.
   * \param [in] filename data set filename
   * \param [in] featureType type of all features
   * \return success
   ****************************************************************************/
  bool LoadDataset(std::string filename, FeatureType featureType);
  /// Return the number of instances.
  unsigned int NumInstances() const;
  /// Return the number of features.
  unsigned int NumFeatures() const;
  /*************************************************************************//**
   * Get the instance at index. Throws std::out_of_range for a bad index.
   * \param [in] index instance index
   * \return pointer to DatasetInstance
   ****************************************************************************/
  DatasetInstance* GetInstance(unsigned int index) const;
  /// Get the class label of the instance at index.
  ClassLevel GetClass(unsigned int instanceIndex) const;
  /// Get the type of all features.
  FeatureType GetFeatureType() const;
  /// Get the feature names.
  std::vector<std::string> GetFeatureNames() const;
  /// Get the data file name, empty if loaded from memory.
  std::string GetFilename() const;
  /*************************************************************************//**
   * Get the min and max observed value of a feature.
   * \param [in] featureIndex feature index
   * \return pair: min, max
   ****************************************************************************/
  std::pair<double, double> GetMinMaxForFeature(unsigned int featureIndex) const;
  /// Observed max - min of a feature, or 1 when the feature is constant.
  double GetRangeForFeature(unsigned int featureIndex) const;
  /// Return the number of distinct class labels.
  unsigned int NumClasses() const;
  /// Return the instance indices of each class.
  const std::map<ClassLevel, std::vector<unsigned int> >& GetClassIndexes() const;
  /*************************************************************************//**
   * Get the proportion of instances in a class.
   * \param [in] thisClass class label
   * \return probability of class, 0 for an unknown class
   ****************************************************************************/
  double GetClassProbability(ClassLevel thisClass) const;
  /// Print the instances to outStream.
  void Print(std::ostream& outStream=std::cout) const;
  /// Print summary statistics of instances, features and classes.
  void PrintStats(std::ostream& outStream=std::cout) const;
private:
  Dataset(const Dataset& other);
  Dataset& operator=(const Dataset& other);
  /// Free all instances and reset bookkeeping.
  void Clear();
  /// Compute min/max ranges and class indexes after loading.
  void UpdateStats();

  /// instances in row order
  std::vector<DatasetInstance*> instances;
  /// feature names
  std::vector<std::string> featureNames;
  /// type of all features
  FeatureType featureType;
  /// min, max of each feature
  std::vector<std::pair<double, double> > featuresMinMax;
  /// class label -> instance indices
  std::map<ClassLevel, std::vector<unsigned int> > classIndexes;
  /// file from which the data set was read
  std::string dataFilename;
};

#endif
