/**
 * =============================================================================
 * NaiveBayesClassifier.hpp - Public Interface for the Text Classifier
 * =============================================================================
 *
 * Multinomial Naive Bayes over bag-of-words count vectors.
 *
 * INPUT FORMAT:
 * -------------
 * A feature-extraction stage (not part of this library) turns each text
 * into a vector of V word counts, V = vocabulary size:
 *
 *   "free money, free!"  →  [0, 2, 1, 0, ...]   (count of word_j at slot j)
 *
 * Training takes N such rows plus N integer class labels.
 *
 * MODEL:
 * ------
 *   prior(c)          = (#examples labelled c) / N
 *   conditional(c)[j] ≈ P(word_j | c), Laplace-smoothed by delta
 *
 *   score(c | doc)    = log prior(c) + Σ_j doc[j] * log conditional(c)[j]
 *
 * Scores are kept in log space: multiplying hundreds of probabilities < 1
 * underflows to 0.0 long before the document ends.
 *
 * CLASS ORDERING:
 * ---------------
 * Every score or probability vector returned by this class is indexed by
 * the RANK of the label among the sorted distinct training labels:
 *
 *   training labels {7, 2, 7, 5}  →  getClassLabels() == {2, 5, 7}
 *   estimateClassPosteriors(x)[0] is the score of label 2, [1] of 5, [2] of 7
 *
 * @file NaiveBayesClassifier.hpp
 * @author Naive Bayes Text Classifier
 * @version 1.0.0
 */

#ifndef NAIVE_BAYES_CLASSIFIER_HPP
#define NAIVE_BAYES_CLASSIFIER_HPP

#include <map>      // std::map for label-keyed estimates
#include <memory>   // std::unique_ptr for PIMPL pattern
#include <string>
#include <vector>

#include "ClassifierErrors.hpp"

/**
 * NaiveBayesClassifier - train once with fit(), then classify feature vectors.
 *
 * LIFECYCLE:
 * - Constructed untrained. Every inference call throws NotTrainedError.
 * - fit() computes a complete model and replaces any previous one.
 *   There is no incremental update.
 * - A failed fit() leaves the previous model in place.
 *
 * THREAD SAFETY:
 * None. Concurrent fit() calls, or fit() concurrent with inference, on one
 * instance are not supported. Use one instance per thread or lock outside.
 *
 * USAGE EXAMPLE:
 * ```cpp
 * NaiveBayesClassifier clf;
 * clf.fit(trainFeatures, trainLabels);          // delta = 1.0
 *
 * int label = clf.predict(docFeatures);
 * std::vector<float> probs = clf.predictProba(docFeatures);
 * // probs[i] belongs to clf.getClassLabels()[i]
 * ```
 */
class NaiveBayesClassifier {
public:
    /** N rows of V word counts. */
    using FeatureMatrix = std::vector<std::vector<float>>;

    // ========================================================================
    // CONSTRUCTORS & DESTRUCTOR
    // ========================================================================

    /**
     * Creates an untrained classifier with vocabulary size 0.
     */
    NaiveBayesClassifier();

    /**
     * Defined in the .cpp because unique_ptr<Impl> needs the complete type.
     */
    ~NaiveBayesClassifier();

    // ========================================================================
    // TRAINING
    // ========================================================================

    /**
     * Train the classifier.
     *
     * STEPS:
     * 1. Estimate class priors from the labels
     * 2. Set the vocabulary size to the feature width (columns of row 0)
     * 3. Estimate smoothed conditional probabilities
     * 4. Replace the stored model with the new one
     *
     * @param features Training matrix, one bag-of-words row per example
     * @param labels   Class label of each row (same length as features)
     * @param delta    Additive smoothing strength, >= 0. delta = 0 disables
     *                 smoothing and may yield zero probabilities.
     *
     * @throws std::invalid_argument on empty labels, row/label count
     *         mismatch, ragged rows, or negative delta
     */
    void fit(const FeatureMatrix& features, const std::vector<int>& labels, float delta = 1.0f);

    /**
     * Empirical class frequencies: count(c) / N. No smoothing.
     *
     * @param labels Training labels
     * @return label → prior, one entry per distinct label (sums to 1.0)
     * @throws std::invalid_argument if labels is empty
     */
    std::map<int, float> estimateClassPriors(const std::vector<int>& labels) const;

    /**
     * Smoothed per-class word likelihoods.
     *
     * For class c with examples x_1..x_k (in training order):
     *
     *   denom(c)      = vocabSize * delta + Σ_i Σ_j x_i[j]
     *   conditional_c = (x_1 + delta) / denom(c) + Σ_{i>=2} x_i / denom(c)
     *
     * delta enters the numerator once per class, through the first example
     * of that class only. vocabSize is the value currently stored on the
     * classifier (see fit() and setVocabularySize()).
     *
     * Every component is > 0 whenever delta > 0 and the denominator is
     * positive.
     *
     * @return label → vector of length V
     * @throws std::invalid_argument on row/label count mismatch, ragged rows,
     *         or negative delta
     */
    std::map<int, std::vector<float>> estimateConditionalProbabilities(
        const FeatureMatrix& features, const std::vector<int>& labels, float delta) const;

    // ========================================================================
    // INFERENCE
    // ========================================================================

    /**
     * Log-posterior score of every class, ascending label order.
     *
     * @param feature Bag-of-words vector of one document (length V)
     * @return One log-posterior per class
     * @throws NotTrainedError if fit() has not succeeded yet
     * @throws std::invalid_argument if feature length != trained width
     */
    std::vector<float> estimateClassPosteriors(const std::vector<float>& feature) const;

    /**
     * Most probable class label (arg-max of the log-posteriors).
     * On a tie the smaller label wins.
     *
     * @throws NotTrainedError if fit() has not succeeded yet
     */
    int predict(const std::vector<float>& feature) const;

    /**
     * Probability distribution over classes (softmax of the log-posteriors).
     *
     * @return Non-negative vector summing to 1.0, ascending label order
     * @throws NotTrainedError if fit() has not succeeded yet
     */
    std::vector<float> predictProba(const std::vector<float>& feature) const;

    // ========================================================================
    // ACCESSOR METHODS
    // ========================================================================

    bool isTrained() const;

    /**
     * Sorted distinct training labels. Maps an output index back to a label.
     * @throws NotTrainedError if untrained
     */
    std::vector<int> getClassLabels() const;

    /** Number of classes, 0 when untrained. */
    int getNumClasses() const;

    /** @throws NotTrainedError if untrained */
    std::map<int, float> getClassPriors() const;

    /** @throws NotTrainedError if untrained */
    std::map<int, std::vector<float>> getConditionalProbabilities() const;

    /**
     * Vocabulary size used in the smoothing denominator.
     * Set by fit(); 0 before the first fit().
     */
    int getVocabularySize() const;

    /**
     * Override the vocabulary size read by estimateConditionalProbabilities().
     * Does not touch an already trained model.
     * @throws std::invalid_argument if vocabSize < 0
     */
    void setVocabularySize(int vocabSize);

    /** Print training events to std::cout. Off by default. */
    void setVerbose(bool verbose);

    /**
     * Get the library version string.
     * @return Version string (e.g., "1.0.0")
     */
    std::string getVersion() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#endif // NAIVE_BAYES_CLASSIFIER_HPP
