/*
 * FeatReliefCLI.cpp
 *
 * Relief family feature weighting - Command Line Interface (CLI)
 *
 * Reads a whitespace-delimited data set with a header row and a "class"
 * column, runs one ranker and prints "score<TAB>name" best first to stdout.
 */

#include <cstdlib>
#include <ctime>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/scoped_ptr.hpp>

#include "AttributeRanker.h"
#include "Dataset.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "ReliefFunctions.h"
#include "StringUtils.h"

using namespace std;
using namespace featrelief;
namespace po = boost::program_options;
using boost::lexical_cast;

int main(int argc, char** argv) {

  // command line processing variables: defaults and storage for boost
  string configFilename = "";
  string dataFilename = "";
  string featureTypeName = "";
  string algorithm = "relieff";
  // ReliefF
  string mode = "k_nearest";
  // numeric options are kept as typed and converted by the library, which
  // rejects malformed and negative values
  string k = lexical_cast<string>(DEFAULT_K_NEAREST_NEIGHBORS);
  string m = "0";
  string randomSeed = lexical_cast<string>(DEFAULT_RANDOM_SEED);
  string expRankSigma = lexical_cast<string>(DEFAULT_EXP_RANK_SIGMA);
  // Iterative Relief
  string iterations = lexical_cast<string>(DEFAULT_ITERATIONS);
  string kernelWidth = lexical_cast<string>(DEFAULT_KERNEL_WIDTH);
  string tolerance = "1e-05";
  // selection
  string numToSelectValue = "0";

  // declare the supported options
  po::options_description desc("Allowed options");
  desc.add_options()
          ("help", "produce help message")
          (
           "config-file,c",
           po::value<string > (&configFilename),
           "read configuration options from file - command line overrides these"
           )
          (
           "data,d",
           po::value<string > (&dataFilename),
           "read instances from whitespace-delimited file with a header row and a class column"
           )
          (
           "f-type,f",
           po::value<string > (&featureTypeName),
           "feature type (continuous|discrete)"
           )
          (
           "algorithm,a",
           po::value<string > (&algorithm)->default_value(algorithm),
           "ranking algorithm (relieff|iterative-relief|surf|surfstar|multisurf)"
           )
          (
           "mode",
           po::value<string > (&mode)->default_value(mode),
           "ReliefF weight update mode (k_nearest|diff|exp_rank)"
           )
          (
           "k-nearest-neighbors,k",
           po::value<string>(&k)->default_value(k),
           "set k nearest neighbors"
           )
          (
           "number-random-samples,m",
           po::value<string>(&m)->default_value(m),
           "number of random samples (0=all|1 <= n <= number of samples)"
           )
          (
           "random-seed",
           po::value<string>(&randomSeed)->default_value(randomSeed),
           "seed for random instance sampling"
           )
          (
           "exp-rank-sigma",
           po::value<string>(&expRankSigma)->default_value(expRankSigma),
           "exp_rank rank decay sigma"
           )
          (
           "iterations,i",
           po::value<string>(&iterations)->default_value(iterations),
           "Iterative Relief maximum number of iterations"
           )
          (
           "kernel-width",
           po::value<string>(&kernelWidth)->default_value(kernelWidth),
           "Iterative Relief distance kernel width"
           )
          (
           "tolerance",
           po::value<string>(&tolerance)->default_value(tolerance),
           "Iterative Relief convergence tolerance (L1 change of weights)"
           )
          (
           "n-features-to-select,n",
           po::value<string>(&numToSelectValue)->default_value(numToSelectValue),
           "print only the n best features (0=all)"
           )
          ;

  // parse the command line into a map
  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch(const po::error& e) {
    cerr << "ERROR: " << e.what() << endl;
    cerr << desc << endl;
    exit(COMMAND_LINE_ERROR);
  }

  if(vm.count("help") || (argc == 1)) {
    cerr << desc << endl;
    exit(COMMAND_LINE_ERROR);
  }

  // ---------------------------------------------------------------------------
  cout << Timestamp() << argv[0] << " starting" << endl;
  clock_t t;
  t = clock();

  // ---------------------------------------------------------------------------
  cout << Timestamp() << "Processing command line arguments" << endl;

  // read config file if specified
  if(vm.count("config-file")) {
    ifstream configStream(configFilename.c_str());
    if(!configStream.is_open()) {
      cerr << "ERROR: Could not open configuration file: "
              << configFilename << endl;
      exit(COMMAND_LINE_ERROR);
    }
    cout << Timestamp() << "Reading configuration options from: "
            << configFilename << endl;
    try {
      po::store(po::parse_config_file(configStream, desc), vm);
      po::notify(vm);
    } catch(const po::error& e) {
      cerr << "ERROR: " << configFilename << ": " << e.what() << endl;
      exit(COMMAND_LINE_ERROR);
    }
    configStream.close();
  }

  if(dataFilename == "") {
    cerr << "ERROR: --data is required" << endl;
    exit(COMMAND_LINE_ERROR);
  }
  if(featureTypeName == "") {
    cerr << "ERROR: --f-type is required (continuous|discrete)" << endl;
    exit(COMMAND_LINE_ERROR);
  }

  /// algorithm options are passed to the library as a ConfigMap
  ConfigMap configMap;
  configMap.insert(make_pair("f-type", featureTypeName));
  configMap.insert(make_pair("mode", mode));
  configMap.insert(make_pair("k-nearest-neighbors", k));
  configMap.insert(make_pair("number-random-samples", m));
  configMap.insert(make_pair("random-seed", randomSeed));
  configMap.insert(make_pair("exp-rank-sigma", expRankSigma));
  configMap.insert(make_pair("iterations", iterations));
  configMap.insert(make_pair("kernel-width", kernelWidth));
  configMap.insert(make_pair("tolerance", tolerance));
  configMap.insert(make_pair("n-features-to-select", numToSelectValue));

  try {
    // fail fast on names and numbers before reading any data
    FeatureType featureType = FeatureTypeFromConfig(configMap);
    if(to_lower(algorithm) == "relieff") {
      WeightUpdateModeFromString(mode);
    }
    GetConfigValueAs<unsigned int>(configMap, "k-nearest-neighbors", 0);
    GetConfigValueAs<unsigned int>(configMap, "number-random-samples", 0);
    GetConfigValueAs<unsigned long int>(configMap, "random-seed", 0);
    GetConfigValueAs<double>(configMap, "exp-rank-sigma", 0.0);
    GetConfigValueAs<unsigned int>(configMap, "iterations", 0);
    GetConfigValueAs<double>(configMap, "kernel-width", 0.0);
    GetConfigValueAs<double>(configMap, "tolerance", 0.0);
    unsigned int numToSelect =
            GetConfigValueAs<unsigned int>(configMap, "n-features-to-select", 0);

    // -------------------------------------------------------------------------
    cout << Timestamp() << "Loading data set" << endl;
    Dataset ds;
    ds.LoadDataset(dataFilename, featureType);
    ds.PrintStats();

    // -------------------------------------------------------------------------
    cout << Timestamp() << "Running " << algorithm << endl;
    boost::scoped_ptr<AttributeRanker> ranker(CreateRanker(algorithm, &ds,
                                                           configMap));
    ranker->ComputeScores();
    cout << Timestamp() << algorithm << " done" << endl;

    if(numToSelect) {
      vector<unsigned int> selected = ranker->SelectTopFeatures(numToSelect);
      vector<string> names = ds.GetFeatureNames();
      vector<string> selectedNames;
      for(unsigned int i = 0; i < selected.size(); ++i) {
        selectedNames.push_back(names[selected[i]]);
      }
      cout << Timestamp() << "Selected " << selected.size() << " features: "
              << join(selectedNames.begin(), selectedNames.end(), string(" "))
              << endl;
    }

    ranker->PrintScores(cout, numToSelect);
  } catch(const FeatReliefException& e) {
    cerr << "ERROR: " << e.what() << endl;
    exit(DATASET_LOAD_ERROR);
  } catch(const std::exception& e) {
    cerr << "ERROR: " << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  float elapsedTime = (float) (clock() - t) / CLOCKS_PER_SEC;
  cout << Timestamp() << "Elapsed time " << elapsedTime << " secs" << endl;

  cout << Timestamp() << argv[0] << " done" << endl;

  return 0;
}
