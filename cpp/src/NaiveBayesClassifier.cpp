/**
 * =============================================================================
 * NaiveBayesClassifier.cpp - Multinomial Naive Bayes Training and Inference
 * =============================================================================
 *
 * TRAINING PIPELINE:
 * 1. Count labels → class priors
 * 2. Sum the word counts of each class → smoothing denominators
 * 3. Accumulate each class's rows → conditional word probabilities
 * 4. Freeze both into an immutable TrainedModel
 *
 * INFERENCE PIPELINE:
 * 1. Score each class in log space (TrainedModel::logPosteriors)
 * 2. predict:      arg-max of the scores
 *    predictProba: softmax of the scores
 *
 * DESIGN PATTERN: PIMPL (Pointer to Implementation)
 * The trained model, the vocabulary size and the logging switch all live in
 * Impl, so the public header only exposes std:: types.
 *
 * @file NaiveBayesClassifier.cpp
 * @author Naive Bayes Text Classifier
 * @version 1.0.0
 */

// ============================================================================
// INCLUDES
// ============================================================================

#include "NaiveBayesClassifier.hpp"

#include "NaiveBayesModel.hpp"  // Immutable trained parameters
#include "Softmax.hpp"          // Softmax + arg-max over class scores

#include <iostream>    // std::cout for verbose training trace
#include <optional>    // std::optional<TrainedModel> - empty means untrained
#include <stdexcept>   // std::invalid_argument for malformed input
#include <string>
#include <utility>

// ============================================================================
// PIMPL IMPLEMENTATION CLASS
// ============================================================================

struct NaiveBayesClassifier::Impl {
    // ========================================================================
    // STATE
    // ========================================================================

    /**
     * The trained model.
     * std::nullopt until the first successful fit(), replaced whole by
     * every later fit(). Inference code only ever reads through requireModel().
     */
    std::optional<TrainedModel> model;

    /**
     * Smoothing denominator term: denom(c) = vocabSize * delta + total_words(c).
     * fit() sets it to the feature width before estimating conditionals.
     */
    int vocabSize = 0;

    /** Print a training trace to std::cout. */
    bool verbose = false;

    // ========================================================================
    // HELPER METHODS
    // ========================================================================

    /**
     * Return the trained model or throw NotTrainedError.
     */
    const TrainedModel& requireModel() const {
        if (!model) {
            throw NotTrainedError();
        }
        return *model;
    }

    /**
     * Reject inputs the estimators cannot handle.
     *
     * Checks:
     * - one label per row
     * - every row as wide as the first
     * - delta >= 0
     */
    static void checkTrainingSet(const FeatureMatrix& features,
                                 const std::vector<int>& labels,
                                 float delta) {
        if (features.size() != labels.size()) {
            throw std::invalid_argument("Feature matrix has " + std::to_string(features.size()) +
                                        " rows but " + std::to_string(labels.size()) +
                                        " labels were given");
        }
        if (delta < 0.0f) {
            throw std::invalid_argument("Smoothing delta must be >= 0, got " +
                                        std::to_string(delta));
        }
        for (size_t i = 1; i < features.size(); ++i) {
            if (features[i].size() != features[0].size()) {
                throw std::invalid_argument("Feature row " + std::to_string(i) + " has width " +
                                            std::to_string(features[i].size()) + ", expected " +
                                            std::to_string(features[0].size()));
            }
        }
    }

    /**
     * Conditional probability estimation with an explicit vocabulary size.
     *
     * PASS 1: total_words(c) = sum of every count in every row of class c
     * PASS 2: walk the rows in training order
     *   - first row of class c:  conditional_c  = (row + delta) / denom(c)
     *   - later rows of class c: conditional_c += row / denom(c)
     *
     * Example (V = 3, delta = 1, class 0 rows [1,0,0] then [0,1,0]):
     *   denom = 3*1 + 2 = 5
     *   [2,1,1]/5 + [0,1,0]/5 = [0.4, 0.4, 0.2]
     */
    static std::map<int, std::vector<float>> accumulateConditionals(
        const FeatureMatrix& features,
        const std::vector<int>& labels,
        float delta,
        int vocabSize) {

        // --------------------------------------------------------------------
        // PASS 1: Total word count per class
        // --------------------------------------------------------------------
        std::map<int, float> totalWords;
        for (size_t i = 0; i < labels.size(); ++i) {
            float rowTotal = 0.0f;
            for (float count : features[i]) {
                rowTotal += count;
            }
            totalWords[labels[i]] += rowTotal;  // operator[] value-initializes to 0
        }

        // --------------------------------------------------------------------
        // PASS 2: Accumulate scaled rows
        // --------------------------------------------------------------------
        std::map<int, std::vector<float>> conditionals;
        for (size_t i = 0; i < labels.size(); ++i) {
            const int label = labels[i];
            const std::vector<float>& row = features[i];
            const float denom = static_cast<float>(vocabSize) * delta + totalWords[label];

            auto it = conditionals.find(label);
            if (it == conditionals.end()) {
                std::vector<float> probs(row.size());
                for (size_t j = 0; j < row.size(); ++j) {
                    probs[j] = (row[j] + delta) / denom;
                }
                conditionals.emplace(label, std::move(probs));
            } else {
                std::vector<float>& probs = it->second;
                for (size_t j = 0; j < row.size(); ++j) {
                    probs[j] += row[j] / denom;
                }
            }
        }

        return conditionals;
    }
};

// ============================================================================
// CONSTRUCTOR & DESTRUCTOR
// ============================================================================

NaiveBayesClassifier::NaiveBayesClassifier() : pImpl(std::make_unique<Impl>()) {}

NaiveBayesClassifier::~NaiveBayesClassifier() = default;

// ============================================================================
// TRAINING
// ============================================================================

/**
 * Everything is computed into locals first and committed at the end,
 * so an exception leaves the previous model and vocabulary size intact.
 */
void NaiveBayesClassifier::fit(const FeatureMatrix& features,
                               const std::vector<int>& labels,
                               float delta) {
    Impl::checkTrainingSet(features, labels, delta);

    std::map<int, float> priors = estimateClassPriors(labels);

    // Vocabulary size = number of columns of the feature matrix
    const int vocabSize = static_cast<int>(features.front().size());

    std::map<int, std::vector<float>> conditionals =
        Impl::accumulateConditionals(features, labels, delta, vocabSize);

    TrainedModel model = TrainedModel::fromEstimates(priors, conditionals, vocabSize);

    // ========================================================================
    // COMMIT
    // ========================================================================
    pImpl->vocabSize = vocabSize;
    pImpl->model = std::move(model);

    if (pImpl->verbose) {
        std::cout << "Naive Bayes model trained" << std::endl;
        std::cout << "  Examples: " << labels.size() << std::endl;
        std::cout << "  Classes: " << pImpl->model->getNumClasses() << std::endl;
        std::cout << "  Vocabulary size: " << pImpl->model->getVocabSize() << std::endl;
        std::cout << "  Delta: " << delta << std::endl;
        for (const auto& cls : pImpl->model->getClasses()) {
            std::cout << "  Class " << cls.label << ": prior=" << cls.prior
                      << " width=" << cls.conditionalProbabilities.size() << std::endl;
        }
    }
}

std::map<int, float> NaiveBayesClassifier::estimateClassPriors(const std::vector<int>& labels) const {
    if (labels.empty()) {
        throw std::invalid_argument("Cannot estimate class priors from an empty label vector");
    }

    std::map<int, int> counts;
    for (int label : labels) {
        ++counts[label];
    }

    std::map<int, float> priors;
    const float total = static_cast<float>(labels.size());
    for (const auto& entry : counts) {
        priors[entry.first] = static_cast<float>(entry.second) / total;
    }
    return priors;
}

std::map<int, std::vector<float>> NaiveBayesClassifier::estimateConditionalProbabilities(
    const FeatureMatrix& features, const std::vector<int>& labels, float delta) const {
    Impl::checkTrainingSet(features, labels, delta);
    return Impl::accumulateConditionals(features, labels, delta, pImpl->vocabSize);
}

// ============================================================================
// INFERENCE
// ============================================================================

std::vector<float> NaiveBayesClassifier::estimateClassPosteriors(const std::vector<float>& feature) const {
    return pImpl->requireModel().logPosteriors(feature);
}

/**
 * The index returned by arg-max is a rank among the sorted labels;
 * translate it back to the label itself.
 */
int NaiveBayesClassifier::predict(const std::vector<float>& feature) const {
    const TrainedModel& model = pImpl->requireModel();
    std::vector<float> logPosteriors = model.logPosteriors(feature);
    int best = Softmax::argMax(logPosteriors);
    return model.getClasses()[best].label;
}

std::vector<float> NaiveBayesClassifier::predictProba(const std::vector<float>& feature) const {
    return Softmax::compute(pImpl->requireModel().logPosteriors(feature));
}

// ============================================================================
// ACCESSOR METHODS
// ============================================================================

bool NaiveBayesClassifier::isTrained() const {
    return pImpl->model.has_value();
}

std::vector<int> NaiveBayesClassifier::getClassLabels() const {
    return pImpl->requireModel().getLabels();
}

int NaiveBayesClassifier::getNumClasses() const {
    return pImpl->model ? pImpl->model->getNumClasses() : 0;
}

std::map<int, float> NaiveBayesClassifier::getClassPriors() const {
    std::map<int, float> priors;
    for (const auto& cls : pImpl->requireModel().getClasses()) {
        priors[cls.label] = cls.prior;
    }
    return priors;
}

std::map<int, std::vector<float>> NaiveBayesClassifier::getConditionalProbabilities() const {
    std::map<int, std::vector<float>> conditionals;
    for (const auto& cls : pImpl->requireModel().getClasses()) {
        conditionals[cls.label] = cls.conditionalProbabilities;
    }
    return conditionals;
}

int NaiveBayesClassifier::getVocabularySize() const {
    return pImpl->vocabSize;
}

void NaiveBayesClassifier::setVocabularySize(int vocabSize) {
    if (vocabSize < 0) {
        throw std::invalid_argument("Vocabulary size must be >= 0, got " +
                                    std::to_string(vocabSize));
    }
    pImpl->vocabSize = vocabSize;
}

void NaiveBayesClassifier::setVerbose(bool verbose) {
    pImpl->verbose = verbose;
}

std::string NaiveBayesClassifier::getVersion() const {
    return "1.0.0";
}
