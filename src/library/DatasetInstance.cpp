/*
 * DatasetInstance.cpp
 *
 * Class to hold data set instances (rows)
 */

#include <iostream>
#include <vector>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "Dataset.h"
#include "DatasetInstance.h"

using namespace std;

DatasetInstance::DatasetInstance(Dataset* ds, unsigned int index) {
  dataset = ds;
  instanceIndex = index;
  classLabel = MISSING_DISCRETE_CLASS_VALUE;
}

DatasetInstance::~DatasetInstance() {
}

Dataset* DatasetInstance::GetDatasetPtr() {
  return dataset;
}

unsigned int DatasetInstance::GetIndex() const {
  return instanceIndex;
}

bool DatasetInstance::LoadInstanceFromVector(const FeatureRow& newValues) {
  if(!newValues.size()) {
    return false;
  }
  features.assign(newValues.begin(), newValues.end());
  return true;
}

unsigned int DatasetInstance::NumFeatures() const {
  return(features.size());
}

FeatureLevel DatasetInstance::GetFeature(unsigned int index) const {
  if(index >= features.size()) {
    throw out_of_range("DatasetInstance::GetFeature: feature index " +
                       boost::lexical_cast<string>(index) +
                       " is out of range");
  }
  return features[index];
}

ClassLevel DatasetInstance::GetClass() const {
  return classLabel;
}

void DatasetInstance::SetClass(ClassLevel classValue) {
  classLabel = classValue;
}

void DatasetInstance::Print(ostream& outStream) const {
  FeatureRow::const_iterator it = features.begin();
  for(; it != features.end(); ++it) {
    outStream << *it << " ";
  }
  outStream << "=> [" << classLabel << "]" << endl;
}
