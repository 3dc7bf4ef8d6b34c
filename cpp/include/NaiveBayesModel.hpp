#ifndef NAIVE_BAYES_MODEL_HPP
#define NAIVE_BAYES_MODEL_HPP

#include <map>
#include <vector>

/**
 * Parameters learned for one class.
 */
struct ClassStatistics {
    int label;
    float prior;
    std::vector<float> conditionalProbabilities;  // P(word_j | label), one per vocabulary slot
};

/**
 * TrainedModel - immutable result of training a multinomial Naive Bayes model.
 *
 * Classes are stored once, sorted by ascending label. Index i of every
 * score vector this model produces belongs to getClasses()[i].label.
 *
 * A TrainedModel can only be built from a complete set of estimates, so
 * holding one means the classifier is trained.
 */
class TrainedModel {
public:
    /**
     * Build the ordered class list from the two estimator outputs.
     * @throws std::invalid_argument if either mapping is empty, the label
     *         sets differ, or the conditional vectors differ in length
     */
    static TrainedModel fromEstimates(const std::map<int, float>& priors,
                                      const std::map<int, std::vector<float>>& conditionals,
                                      int vocabSize);

    /**
     * log P(c) + Σ_j log P(word_j | c) * feature[j] for every class c,
     * in ascending label order.
     * @throws std::invalid_argument if feature length != getFeatureWidth()
     */
    std::vector<float> logPosteriors(const std::vector<float>& feature) const;

    const std::vector<ClassStatistics>& getClasses() const { return classes; }
    std::vector<int> getLabels() const;
    int getNumClasses() const { return static_cast<int>(classes.size()); }
    int getVocabSize() const { return vocabSize; }

    /** Length of the conditional vectors, i.e. the expected feature length. */
    int getFeatureWidth() const;

private:
    TrainedModel(std::vector<ClassStatistics> classes, int vocabSize);

    std::vector<ClassStatistics> classes;
    int vocabSize;
};

#endif // NAIVE_BAYES_MODEL_HPP
