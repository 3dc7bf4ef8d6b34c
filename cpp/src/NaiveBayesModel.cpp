#include "NaiveBayesModel.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

TrainedModel::TrainedModel(std::vector<ClassStatistics> classes, int vocabSize)
    : classes(std::move(classes))
    , vocabSize(vocabSize)
{
}

TrainedModel TrainedModel::fromEstimates(const std::map<int, float>& priors,
                                         const std::map<int, std::vector<float>>& conditionals,
                                         int vocabSize) {
    if (priors.empty() || conditionals.empty()) {
        throw std::invalid_argument("Cannot build a model from empty estimates");
    }
    if (priors.size() != conditionals.size()) {
        throw std::invalid_argument("Prior and conditional estimates cover different classes");
    }

    std::vector<ClassStatistics> classes;
    classes.reserve(priors.size());

    // std::map iterates in ascending key order
    for (const auto& entry : priors) {
        auto it = conditionals.find(entry.first);
        if (it == conditionals.end()) {
            throw std::invalid_argument("No conditional estimate for class " +
                                        std::to_string(entry.first));
        }
        if (!classes.empty() &&
            it->second.size() != classes.front().conditionalProbabilities.size()) {
            throw std::invalid_argument("Conditional vectors differ in length");
        }
        classes.push_back(ClassStatistics{entry.first, entry.second, it->second});
    }

    return TrainedModel(std::move(classes), vocabSize);
}

std::vector<float> TrainedModel::logPosteriors(const std::vector<float>& feature) const {
    if (feature.size() != static_cast<size_t>(getFeatureWidth())) {
        throw std::invalid_argument("Feature vector length " + std::to_string(feature.size()) +
                                    " does not match trained width " +
                                    std::to_string(getFeatureWidth()));
    }

    std::vector<float> scores;
    scores.reserve(classes.size());

    for (const auto& cls : classes) {
        double logLikelihood = 0.0;
        for (size_t j = 0; j < feature.size(); ++j) {
            logLikelihood += std::log(cls.conditionalProbabilities[j]) * feature[j];
        }
        scores.push_back(static_cast<float>(std::log(cls.prior) + logLikelihood));
    }

    return scores;
}

std::vector<int> TrainedModel::getLabels() const {
    std::vector<int> labels;
    labels.reserve(classes.size());
    for (const auto& cls : classes) {
        labels.push_back(cls.label);
    }
    return labels;
}

int TrainedModel::getFeatureWidth() const {
    return classes.empty() ? 0 : static_cast<int>(classes.front().conditionalProbabilities.size());
}
