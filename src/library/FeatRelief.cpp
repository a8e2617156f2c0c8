/*
 * File:   FeatRelief.cpp
 *
 * Common functions for the Relief rankers: logging timestamps, configuration
 * map access and feature type/mode name parsing.
 */

#include <cstdlib>
#include <iostream>
#include <string>
#include <ctime>

#include "FeatRelief.h"
#include "FeatReliefExceptions.h"
#include "StringUtils.h"

using namespace std;
using namespace featrelief;

string Timestamp() {

	time_t now = time(NULL);
	struct tm * ptm = localtime(&now);
	char buffer[32];
	// Format: 20091506 - 20:20:00 -
	strftime(buffer, 32, "%Y%m%d - %H:%M:%S - ", ptm);
	string ts(buffer);

	return ts;
}

bool GetConfigValue(const ConfigMap& configMap, string key, string& value) {
	ConfigMap::const_iterator it = configMap.find(key);
	if(it != configMap.end()) {
		value = trim(it->second);
		if(value == "") {
			return false;
		}
		return true;
	}
	return false;
}

FeatureType FeatureTypeFromString(string typeName) {
	string upperName = to_upper(trim(typeName));
	if(upperName == "CONTINUOUS") {
		return CONTINUOUS_FEATURES;
	}
	if(upperName == "DISCRETE") {
		return DISCRETE_FEATURES;
	}
	throw InvalidFeatureType("[" + typeName +
			"] is not one of continuous|discrete");
}

string FeatureTypeName(FeatureType featureType) {
	switch(featureType) {
	case CONTINUOUS_FEATURES:
		return "continuous";
	case DISCRETE_FEATURES:
		return "discrete";
	}
	throw InvalidFeatureType("unknown feature type enumerator");
}

void CheckFeatureType(FeatureType featureType) {
	FeatureTypeName(featureType);
}

WeightUpdateMode WeightUpdateModeFromString(string modeName) {
	string upperName = to_upper(trim(modeName));
	if(upperName == "K_NEAREST") {
		return K_NEAREST_UPDATE;
	}
	if(upperName == "DIFF") {
		return DIFF_UPDATE;
	}
	if(upperName == "EXP_RANK") {
		return EXP_RANK_UPDATE;
	}
	throw InvalidMode("[" + modeName + "] is not one of k_nearest|diff|exp_rank");
}

string WeightUpdateModeName(WeightUpdateMode mode) {
	switch(mode) {
	case K_NEAREST_UPDATE:
		return "k_nearest";
	case DIFF_UPDATE:
		return "diff";
	case EXP_RANK_UPDATE:
		return "exp_rank";
	}
	throw InvalidMode("unknown weight update mode enumerator");
}

void CheckWeightUpdateMode(WeightUpdateMode mode) {
	WeightUpdateModeName(mode);
}
