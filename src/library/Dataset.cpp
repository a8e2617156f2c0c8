/*
 * Dataset.cpp
 *
 * Collection class holding DatasetInstances
 */

#include <iostream>
#include <iomanip>
#include <fstream>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "Dataset.h"
#include "DatasetInstance.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "StringUtils.h"

using namespace std;
using namespace featrelief;
using boost::lexical_cast;
using boost::bad_lexical_cast;

Dataset::Dataset() {
  featureType = CONTINUOUS_FEATURES;
  dataFilename = "";
}

Dataset::~Dataset() {
  Clear();
}

void Dataset::Clear() {
  vector<DatasetInstance*>::const_iterator it;
  for(it = instances.begin(); it != instances.end(); it++) {
    if(*it) {
      delete *it;
    }
  }
  instances.clear();
  featureNames.clear();
  featuresMinMax.clear();
  classIndexes.clear();
}

bool Dataset::LoadDataset(const FeatureMatrix& dataMatrix,
                          const ClassVector& classLabels,
                          FeatureType newFeatureType,
                          const vector<string>& newFeatureNames) {
  CheckFeatureType(newFeatureType);

  if(dataMatrix.size() < 2) {
    throw InvalidDataset("at least two instances are required, found " +
                         lexical_cast<string>(dataMatrix.size()));
  }
  unsigned int numFeatures = dataMatrix[0].size();
  if(numFeatures < 1) {
    throw InvalidDataset("at least one feature is required");
  }
  for(unsigned int i = 0; i < dataMatrix.size(); ++i) {
    if(dataMatrix[i].size() != numFeatures) {
      throw InvalidDataset("row " + lexical_cast<string>(i) + " has " +
                           lexical_cast<string>(dataMatrix[i].size()) +
                           " features, expected " +
                           lexical_cast<string>(numFeatures));
    }
  }
  if(classLabels.size() != dataMatrix.size()) {
    throw InvalidDataset("target has " +
                         lexical_cast<string>(classLabels.size()) +
                         " labels for " +
                         lexical_cast<string>(dataMatrix.size()) + " rows");
  }
  if(newFeatureNames.size() && (newFeatureNames.size() != numFeatures)) {
    throw InvalidDataset("expected " + lexical_cast<string>(numFeatures) +
                         " feature names, found " +
                         lexical_cast<string>(newFeatureNames.size()));
  }

  Clear();
  featureType = newFeatureType;
  if(newFeatureNames.size()) {
    featureNames = newFeatureNames;
  } else {
    for(unsigned int j = 0; j < numFeatures; ++j) {
      featureNames.push_back(featureNameForIndex(j));
    }
  }

  instances.reserve(dataMatrix.size());
  for(unsigned int i = 0; i < dataMatrix.size(); ++i) {
    DatasetInstance* dsi = new DatasetInstance(this, i);
    dsi->LoadInstanceFromVector(dataMatrix[i]);
    dsi->SetClass(classLabels[i]);
    instances.push_back(dsi);
  }

  UpdateStats();

  return true;
}

bool Dataset::LoadDataset(string filename, FeatureType newFeatureType) {
  CheckFeatureType(newFeatureType);

  ifstream dataStream(filename.c_str());
  if(!dataStream.is_open()) {
    throw InvalidDataset("could not open data set file: " + filename);
  }
  cout << Timestamp() << "Reading whitespace-delimited data set lines from "
          << filename << endl;

  // header row: whitespace-delimited feature names, the special name
  // "class" can be in any position
  string line;
  if(!getline(dataStream, line)) {
    throw InvalidDataset("empty data set file: " + filename);
  }
  vector<string> tokens;
  split(tokens, line);
  vector<string> names;
  unsigned int classColumn = INVALID_INDEX;
  for(unsigned int col = 0; col < tokens.size(); ++col) {
    if(to_upper(tokens[col]) == "CLASS") {
      cout << Timestamp() << "Class column detected at " << col << endl;
      classColumn = col;
    } else {
      names.push_back(tokens[col]);
    }
  }
  if(classColumn == INVALID_INDEX) {
    throw InvalidDataset("no column named \"class\" in header of " + filename);
  }

  FeatureMatrix dataMatrix;
  ClassVector classLabels;
  unsigned int lineNumber = 1;
  while(getline(dataStream, line)) {
    ++lineNumber;
    string trimmedLine = trim(line);
    // skip blank lines in the data section (usually end of file)
    if(!trimmedLine.size()) {
      continue;
    }
    vector<string> values;
    split(values, trimmedLine);
    if(values.size() != tokens.size()) {
      throw InvalidDataset("line " + lexical_cast<string>(lineNumber) +
                           " has " + lexical_cast<string>(values.size()) +
                           " columns, header has " +
                           lexical_cast<string>(tokens.size()));
    }
    FeatureRow row;
    ClassLevel classValue = MISSING_DISCRETE_CLASS_VALUE;
    for(unsigned int col = 0; col < values.size(); ++col) {
      try {
        if(col == classColumn) {
          classValue = lexical_cast<ClassLevel>(values[col]);
        } else {
          row.push_back(lexical_cast<FeatureLevel>(values[col]));
        }
      } catch(const bad_lexical_cast&) {
        throw InvalidDataset("line " + lexical_cast<string>(lineNumber) +
                             ", column " + lexical_cast<string>(col + 1) +
                             ": cannot convert [" + values[col] + "]");
      }
    }
    dataMatrix.push_back(row);
    classLabels.push_back(classValue);
  }
  dataStream.close();

  LoadDataset(dataMatrix, classLabels, newFeatureType, names);
  dataFilename = filename;

  cout << Timestamp() << "Read " << NumInstances() << " instances and "
          << NumFeatures() << " " << FeatureTypeName(featureType)
          << " features" << endl;

  return true;
}

void Dataset::UpdateStats() {
  unsigned int numFeatures = NumFeatures();
  featuresMinMax.assign(numFeatures, make_pair(0.0, 0.0));
  for(unsigned int j = 0; j < numFeatures; ++j) {
    double minValue = instances[0]->features[j];
    double maxValue = minValue;
    for(unsigned int i = 1; i < instances.size(); ++i) {
      double value = instances[i]->features[j];
      if(value < minValue) {
        minValue = value;
      }
      if(value > maxValue) {
        maxValue = value;
      }
    }
    featuresMinMax[j] = make_pair(minValue, maxValue);
  }

  classIndexes.clear();
  for(unsigned int i = 0; i < instances.size(); ++i) {
    classIndexes[instances[i]->GetClass()].push_back(i);
  }
}

unsigned int Dataset::NumInstances() const {
  return instances.size();
}

unsigned int Dataset::NumFeatures() const {
  if(instances.size()) {
    return instances[0]->NumFeatures();
  }
  return 0;
}

DatasetInstance* Dataset::GetInstance(unsigned int index) const {
  if(index >= instances.size()) {
    throw out_of_range("Dataset::GetInstance: instance index " +
                       lexical_cast<string>(index) + " is out of range");
  }
  return instances[index];
}

ClassLevel Dataset::GetClass(unsigned int instanceIndex) const {
  return GetInstance(instanceIndex)->GetClass();
}

FeatureType Dataset::GetFeatureType() const {
  return featureType;
}

vector<string> Dataset::GetFeatureNames() const {
  return featureNames;
}

string Dataset::GetFilename() const {
  return dataFilename;
}

pair<double, double>
Dataset::GetMinMaxForFeature(unsigned int featureIndex) const {
  return featuresMinMax[featureIndex];
}

double Dataset::GetRangeForFeature(unsigned int featureIndex) const {
  pair<double, double> minMax = featuresMinMax[featureIndex];
  double range = minMax.second - minMax.first;
  if(range <= 0.0) {
    return 1.0;
  }
  return range;
}

unsigned int Dataset::NumClasses() const {
  return classIndexes.size();
}

const map<ClassLevel, vector<unsigned int> >& Dataset::GetClassIndexes() const {
  return classIndexes;
}

double Dataset::GetClassProbability(ClassLevel thisClass) const {
  map<ClassLevel, vector<unsigned int> >::const_iterator it =
          classIndexes.find(thisClass);
  if(NumInstances() && (it != classIndexes.end())) {
    return((double) it->second.size() / (double) NumInstances());
  }
  return 0.0;
}

void Dataset::Print(ostream& outStream) const {
  outStream << join(featureNames.begin(), featureNames.end(), string(" "))
          << " => class" << endl;
  vector<DatasetInstance*>::const_iterator it = instances.begin();
  for(; it != instances.end(); ++it) {
    (*it)->Print(outStream);
  }
}

void Dataset::PrintStats(ostream& outStream) const {
  outStream << Timestamp() << "Data set: " << NumInstances() << " instances, "
          << NumFeatures() << " " << FeatureTypeName(featureType)
          << " features, " << NumClasses() << " classes" << endl;
  map<ClassLevel, vector<unsigned int> >::const_iterator it;
  for(it = classIndexes.begin(); it != classIndexes.end(); ++it) {
    outStream << Timestamp() << "Class " << it->first << ": "
            << it->second.size() << " instances ("
            << fixed << setprecision(4) << GetClassProbability(it->first)
            << ")" << endl;
  }
  if(featureType == CONTINUOUS_FEATURES) {
    for(unsigned int j = 0; j < NumFeatures(); ++j) {
      outStream << Timestamp() << featureNames[j] << " range ["
              << featuresMinMax[j].first << ", "
              << featuresMinMax[j].second << "]" << endl;
    }
  }
}
