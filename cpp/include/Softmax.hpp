/**
 * =============================================================================
 * Softmax.hpp - Turning Class Log-Posteriors into Decisions
 * =============================================================================
 *
 * The classifier scores every class with a log-posterior:
 *
 *   score_c = log P(c) + Σ_j count_j * log P(word_j | c)
 *
 * Two things are done with that score vector:
 * 1. predictProba: normalize into a probability distribution (softmax)
 * 2. predict:      pick the best class (arg-max)
 *
 * SOFTMAX OVER LOG-POSTERIORS:
 * ----------------------------
 *   P(c | doc) = exp(score_c) / Σ exp(score_k)
 *
 * Log-posteriors of real documents are large negative numbers
 * (e.g. -850.3, -861.9). exp(-850) underflows to 0.0 in float AND double,
 * so the naive formula returns 0/0 = NaN. Subtracting the maximum first
 * keeps the largest term at exp(0) = 1.
 *
 * NUMERICAL EXAMPLE:
 * Scores: [-850.0, -852.0, -860.0]
 * Shifted: [0.0, -2.0, -10.0]
 * After exp: [1.0, 0.135, 0.0000454]
 * After normalization: [0.881, 0.119, 0.00004]  (sums to 1.0)
 *
 * @file Softmax.hpp
 * @author Naive Bayes Text Classifier
 * @version 1.0.0
 */

#ifndef SOFTMAX_HPP
#define SOFTMAX_HPP

#include <vector>

namespace SoftmaxUtils {

    /**
     * Apply numerically stable softmax normalization to a score vector.
     *
     * ALGORITHM:
     * 1. Find max(scores)
     * 2. Compute exp(score - max) for each score, summing in double
     * 3. Divide by the sum
     *
     * Output index i corresponds to input index i, so the class ordering
     * of the log-posterior vector is preserved.
     *
     * @param scores Unnormalized log-domain scores
     * @return Probabilities (non-negative, sum to 1.0); empty for empty input
     *
     * @example
     * std::vector<float> scores = {-850.0f, -852.0f, -860.0f};
     * auto probs = SoftmaxUtils::softmax(scores);
     * // probs ≈ [0.881, 0.119, 0.00004]
     */
    std::vector<float> softmax(const std::vector<float>& scores);

    /**
     * Index of the largest score.
     *
     * TIE-BREAK:
     * When several entries share the maximum, the FIRST one wins.
     * The classifier orders classes by ascending label, so the
     * smaller label wins a tie.
     *
     * NaN:
     * A NaN score counts as larger than any number, so the first NaN
     * wins. A zero likelihood (delta = 0) times a zero count scores NaN.
     *
     * @param scores Score vector
     * @return Index of the first maximum (or first NaN), -1 for an empty vector
     */
    int argmax(const std::vector<float>& scores);
}

/**
 * Convenience namespace with simpler function names.
 */
namespace Softmax {
    inline std::vector<float> compute(const std::vector<float>& scores) {
        return SoftmaxUtils::softmax(scores);
    }

    inline int argMax(const std::vector<float>& scores) {
        return SoftmaxUtils::argmax(scores);
    }
}

#endif // SOFTMAX_HPP
