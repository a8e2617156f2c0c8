/**
 * \file FeatReliefExceptions.h
 *
 * \brief Exception types thrown by the Relief rankers for caller input
 * errors. None of these are retried or recovered internally.
 *
 * \version 1.0
 */

#ifndef FEATRELIEF_EXCEPTIONS_H
#define FEATRELIEF_EXCEPTIONS_H

#include <stdexcept>
#include <string>

class FeatReliefException : public std::runtime_error {
public:
  explicit FeatReliefException(const std::string& message) :
    std::runtime_error(message) {}
};

/// feature type is neither continuous nor discrete
class InvalidFeatureType : public FeatReliefException {
public:
  explicit InvalidFeatureType(const std::string& message) :
    FeatReliefException("Invalid feature type: " + message) {}
};

/// ReliefF weight update mode is not k_nearest, diff or exp_rank
class InvalidMode : public FeatReliefException {
public:
  explicit InvalidMode(const std::string& message) :
    FeatReliefException("Invalid mode: " + message) {}
};

/// k is zero or not smaller than the number of instances
class InvalidNeighborCount : public FeatReliefException {
public:
  explicit InvalidNeighborCount(const std::string& message) :
    FeatReliefException("Invalid neighbor count: " + message) {}
};

/// Iterative Relief asked to run zero passes
class InvalidIterationCount : public FeatReliefException {
public:
  explicit InvalidIterationCount(const std::string& message) :
    FeatReliefException("Invalid iteration count: " + message) {}
};

/// matrix/target shape violations and unreadable data files
class InvalidDataset : public FeatReliefException {
public:
  explicit InvalidDataset(const std::string& message) :
    FeatReliefException("Invalid dataset: " + message) {}
};

/// configuration value could not be converted
class InvalidConfiguration : public FeatReliefException {
public:
  explicit InvalidConfiguration(const std::string& message) :
    FeatReliefException("Invalid configuration: " + message) {}
};

#endif // FEATRELIEF_EXCEPTIONS_H
