#ifndef NBAYES_ERRORS_HPP_
#define NBAYES_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace nbayes {

// Base of all errors the classifier reports back to its caller. The model is
// left untouched whenever one of these is thrown.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) { }
};

// No training documents, or a class of the class set has no document.
class EmptyTrainingSetError : public Error {
 public:
  explicit EmptyTrainingSetError(const std::string& what) : Error(what) { }
};

// Texts and labels do not pair up.
class LabelMismatchError : public Error {
 public:
  explicit LabelMismatchError(const std::string& what) : Error(what) { }
};

class ModelAlreadyTrainedError : public Error {
 public:
  ModelAlreadyTrainedError() : Error("Model is already trained") { }
};

class ModelNotTrainedError : public Error {
 public:
  ModelNotTrainedError() : Error("Model is not trained yet") { }
};

} // namespace nbayes

#endif
