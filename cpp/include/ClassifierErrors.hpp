#ifndef CLASSIFIER_ERRORS_HPP
#define CLASSIFIER_ERRORS_HPP

#include <stdexcept>

/**
 * Thrown by every inference operation (and by the trained-state accessors)
 * when the classifier has no trained model yet.
 *
 * Derives from std::runtime_error so existing
 * `catch (const std::exception& e)` blocks keep working.
 */
class NotTrainedError : public std::runtime_error {
public:
    NotTrainedError()
        : std::runtime_error("Model not trained. Call fit() first.") {}
};

#endif // CLASSIFIER_ERRORS_HPP
