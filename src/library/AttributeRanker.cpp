/*
 * AttributeRanker.cpp
 *
 * Common scores, ranking and selection for the Relief family rankers.
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "AttributeRanker.h"
#include "Dataset.h"
#include "FeatRelief.h"
#include "FeatReliefExceptions.h"

using namespace std;

/// orders feature indices by descending weight, then ascending index
class WeightIndexGreater {
public:
	WeightIndexGreater(const WeightVector& weights) : W(weights) {
	}
	bool operator()(unsigned int a, unsigned int b) const {
		if (W[a] != W[b]) {
			return W[a] > W[b];
		}
		return a < b;
	}
private:
	const WeightVector& W;
};

AttributeRanker::AttributeRanker(Dataset* ds) {
	if (!ds) {
		throw InvalidDataset("data set is not initialized");
	}
	dataset = ds;
	haveScores = false;
}

AttributeRanker::~AttributeRanker() {
}

AttributeScores AttributeRanker::GetScores() {
	return scores;
}

WeightVector AttributeRanker::GetWeights() const {
	return W;
}

void AttributeRanker::SetWeights(const WeightVector& weights) {
	W = weights;
	vector<string> names = dataset->GetFeatureNames();
	scores.clear();
	for (unsigned int j = 0; j < W.size(); ++j) {
		scores.push_back(make_pair(W[j], names[j]));
	}
	haveScores = true;
}

vector<unsigned int> AttributeRanker::RankedIndices() const {
	if (!haveScores) {
		throw logic_error("AttributeRanker: scores have not been computed");
	}
	vector<unsigned int> indices(W.size());
	for (unsigned int j = 0; j < W.size(); ++j) {
		indices[j] = j;
	}
	sort(indices.begin(), indices.end(), WeightIndexGreater(W));
	return indices;
}

vector<unsigned int> AttributeRanker::GetRanking() const {
	vector<unsigned int> ordered = RankedIndices();
	vector<unsigned int> ranks(ordered.size());
	for (unsigned int position = 0; position < ordered.size(); ++position) {
		ranks[ordered[position]] = position + 1;
	}
	return ranks;
}

vector<unsigned int> AttributeRanker::SelectTopFeatures(unsigned int n) const {
	vector<unsigned int> ranks = GetRanking();
	vector<unsigned int> selected;
	for (unsigned int j = 0; j < ranks.size(); ++j) {
		if (ranks[j] <= n) {
			selected.push_back(j);
		}
	}
	return selected;
}

void AttributeRanker::PrintScores(ostream& outStream,
		unsigned int numToPrint) {
	vector<unsigned int> ordered = RankedIndices();
	if (numToPrint && (numToPrint < ordered.size())) {
		ordered.resize(numToPrint);
	}
	ios_base::fmtflags oldFlags = outStream.flags();
	streamsize oldPrecision = outStream.precision();
	for (unsigned int position = 0; position < ordered.size(); ++position) {
		unsigned int j = ordered[position];
		outStream << fixed << setprecision(8)
				<< scores[j].first << "\t"
				<< scores[j].second << endl;
	}
	outStream.flags(oldFlags);
	outStream.precision(oldPrecision);
}

FeatureMatrix SelectFeatureColumns(const FeatureMatrix& dataMatrix,
		const vector<unsigned int>& columns) {
	FeatureMatrix reduced;
	reduced.reserve(dataMatrix.size());
	for (unsigned int i = 0; i < dataMatrix.size(); ++i) {
		FeatureRow row;
		row.reserve(columns.size());
		for (unsigned int c = 0; c < columns.size(); ++c) {
			if (columns[c] >= dataMatrix[i].size()) {
				throw out_of_range("SelectFeatureColumns: column index "
						+ boost::lexical_cast<string>(columns[c])
						+ " is out of range");
			}
			row.push_back(dataMatrix[i][columns[c]]);
		}
		reduced.push_back(row);
	}
	return reduced;
}
