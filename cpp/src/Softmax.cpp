/**
 * =============================================================================
 * Softmax.cpp - Implementation of Softmax and Arg-Max
 * =============================================================================
 *
 * @file Softmax.cpp
 * @author Naive Bayes Text Classifier
 * @version 1.0.0
 */

#include "Softmax.hpp"

#include <cmath>         // std::exp
#include <algorithm>     // std::max_element, std::find_if
#include <iterator>      // std::distance

namespace SoftmaxUtils {

/**
 * Softmax implementation with numerical stability.
 *
 * NUMERICAL STABILITY TRICK:
 *   softmax(x_i) = exp(x_i - max) / Σ exp(x_j - max)
 *
 * The max cancels out in the division, so the result is unchanged,
 * but the largest exponential is now exp(0) = 1 and the sum is >= 1.
 * The sum is accumulated in double so that many tiny terms are not lost.
 */
std::vector<float> softmax(const std::vector<float>& scores) {
    if (scores.empty()) {
        return {};
    }

    // ========================================================================
    // STEP 1: Find maximum value for numerical stability
    // ========================================================================

    const float maxScore = *std::max_element(scores.begin(), scores.end());

    // ========================================================================
    // STEP 2: Compute exponentials and running sum
    // ========================================================================

    std::vector<double> exponentials;
    exponentials.reserve(scores.size());
    double sum = 0.0;

    for (float score : scores) {
        double expVal = std::exp(static_cast<double>(score) - static_cast<double>(maxScore));
        exponentials.push_back(expVal);
        sum += expVal;
    }

    // ========================================================================
    // STEP 3: Normalize by sum so probabilities sum to 1.0
    // ========================================================================

    std::vector<float> probabilities;
    probabilities.reserve(exponentials.size());
    for (double e : exponentials) {
        probabilities.push_back(static_cast<float>(e / sum));
    }

    return probabilities;
}

/**
 * std::max_element returns the first of several equal maxima,
 * which gives the smaller-index-wins tie-break for free.
 * It never selects a NaN past index 0 (every comparison with NaN is false),
 * so NaN is looked for first.
 */
int argmax(const std::vector<float>& scores) {
    if (scores.empty()) {
        return -1;
    }
    auto nanIt = std::find_if(scores.begin(), scores.end(),
                              [](float score) { return std::isnan(score); });
    if (nanIt != scores.end()) {
        return static_cast<int>(std::distance(scores.begin(), nanIt));
    }
    auto maxIt = std::max_element(scores.begin(), scores.end());
    return static_cast<int>(std::distance(scores.begin(), maxIt));
}

} // namespace SoftmaxUtils
