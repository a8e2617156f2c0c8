/*
 * ReliefF.cpp
 *
 * ReliefF algorithm implementation.
 *
 * Using OpenMP for multi-core parallelization of the per-instance weight
 * deltas; the deltas are folded into the weights in instance order.
 */

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>

#include <omp.h>

#include "ReliefF.h"
#include "AttributeRanker.h"
#include "Dataset.h"
#include "DistanceMetrics.h"
#include "NeighborSearch.h"
#include "WeightUpdatePolicy.h"
#include "GSLRandomFlat.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"

using namespace std;

ReliefF::ReliefF(Dataset* ds, WeightUpdateMode mode, unsigned int kNearest,
		double expRankSigma, unsigned int numRandomSamples,
		unsigned long int randomSeed) :
		AttributeRanker::AttributeRanker(ds) {
	cout << Timestamp() << "ReliefF initialization with parameters" << endl;
	updateMode = mode;
	k = kNearest;
	weightByDistanceSigma = expRankSigma;
	m = numRandomSamples;
	seed = randomSeed;
	Initialize();
}

ReliefF::ReliefF(Dataset* ds, const ConfigMap& configMap) :
		AttributeRanker::AttributeRanker(ds) {
	cout << Timestamp() << "ReliefF initialization with configuration map:"
			<< endl;

	string configValue;
	if (GetConfigValue(configMap, "mode", configValue)) {
		updateMode = WeightUpdateModeFromString(configValue);
	} else {
		updateMode = K_NEAREST_UPDATE;
	}
	k = GetConfigValueAs<unsigned int>(configMap, "k-nearest-neighbors",
			DEFAULT_K_NEAREST_NEIGHBORS);
	weightByDistanceSigma = GetConfigValueAs<double>(configMap,
			"exp-rank-sigma", DEFAULT_EXP_RANK_SIGMA);
	m = GetConfigValueAs<unsigned int>(configMap, "number-random-samples", 0);
	seed = GetConfigValueAs<unsigned long int>(configMap, "random-seed",
			DEFAULT_RANDOM_SEED);
	Initialize();
}

ReliefF::~ReliefF() {
}

void ReliefF::Initialize() {
	CheckWeightUpdateMode(updateMode);
	if (updateMode == K_NEAREST_UPDATE) {
		NeighborSearch::CheckNeighborCount(k, dataset->NumInstances());
	}

	cout << Timestamp() << "Weight update mode: "
			<< WeightUpdateModeName(updateMode) << endl;
	if (updateMode == K_NEAREST_UPDATE) {
		cout << Timestamp() << "Number of nearest neighbors: k = " << k << endl;
	}
	if (updateMode == EXP_RANK_UPDATE) {
		cout << Timestamp() << "Exponential rank decay, using sigma = "
				<< weightByDistanceSigma << endl;
	}

	cout << Timestamp() << "Number of samples: m = " << m << endl;
	if (m == 0 || m == dataset->NumInstances()) {
		// sample deterministically unless a sample size has been set
		cout << Timestamp() << "Sampling all instances deterministically"
				<< endl;
		randomlySelect = false;
		m = dataset->NumInstances();
	} else {
		cout << Timestamp() << "Sampling instances randomly, seed = " << seed
				<< endl;
		randomlySelect = true;
	}

	policy.reset(CreateWeightUpdatePolicy(updateMode, dataset,
			ChooseDiffFunction(dataset->GetFeatureType()),
			weightByDistanceSigma));

	int numProcs = omp_get_num_procs();
	int numThreads = omp_get_max_threads();
	cout << Timestamp() << numProcs << " OpenMP processors available" << endl;
	cout << Timestamp() << numThreads << " OpenMP threads in work team" << endl;
}

vector<unsigned int> ReliefF::ChooseQueryInstances() {
	vector<unsigned int> queryIndices;
	queryIndices.reserve(m);
	if (randomlySelect) {
		// sampled with replacement; a fresh generator per run keeps
		// repeated runs identical
		GSLRandomUniformInt rng(seed, dataset->NumInstances());
		for (unsigned int i = 0; i < m; ++i) {
			queryIndices.push_back((unsigned int) rng.nextIndex());
		}
	} else {
		// every instance against every other instance
		for (unsigned int i = 0; i < m; ++i) {
			queryIndices.push_back(i);
		}
	}
	return queryIndices;
}

bool ReliefF::ComputeAttributeScores() {

	NeighborSearch neighborSearch(dataset);
	neighborSearch.PreComputeDistances();

	unsigned int numFeatures = dataset->NumFeatures();
	vector<unsigned int> queryIndices = ChooseQueryInstances();
	NeighborSearchMode searchMode = policy->GetSearchMode();
	double normalizingFactor = policy->NormalizingFactor(m);

	cout << Timestamp() << "Running Relief-F algorithm" << endl;
	cout << Timestamp() << "Averaging factor: " << setprecision(6)
			<< normalizingFactor << endl;

	// per-instance deltas may be computed in any order
	vector<WeightVector> deltas(m);
	int numSamples = m;
#pragma omp parallel for schedule(dynamic, 1)
	for (int i = 0; i < numSamples; ++i) {
		NeighborSet neighbors = neighborSearch.FindNeighbors(queryIndices[i],
				searchMode, k);
		policy->ComputeDelta(queryIndices[i], neighbors, deltas[i]);
	}

	// ordered fold: identical sums for any thread count
	WeightVector weights(numFeatures, 0.0);
	for (unsigned int i = 0; i < m; ++i) {
		for (unsigned int A = 0; A < numFeatures; ++A) {
			weights[A] += deltas[i][A];
		}
		// happy lights
		if (i && ((i % 100) == 0)) {
			cout << Timestamp() << i << "/" << m << endl;
		}
	}
	for (unsigned int A = 0; A < numFeatures; ++A) {
		weights[A] *= normalizingFactor;
	}
	cout << Timestamp() << m << "/" << m << " done" << endl;

	SetWeights(weights);

	return true;
}

AttributeScores ReliefF::ComputeScores() {
	ComputeAttributeScores();
	return GetScores();
}

WeightUpdateMode ReliefF::GetMode() const {
	return updateMode;
}

unsigned int ReliefF::GetK() const {
	return k;
}

unsigned int ReliefF::GetNumSamples() const {
	return m;
}
