
#include "nbayes.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"

// Model Parameters
DEFINE_string(param, "",
    "The classifier parameter protocol buffer text file.");
DEFINE_double(smoothing, 0,
    "Optional; overrides the smoothing of the parameter file if > 0.");
// Data Parameters
DEFINE_string(train_text, "",
    "Optional; overrides the training docs file.");
DEFINE_string(train_label, "",
    "Optional; overrides the training labels file.");
DEFINE_string(test_text, "",
    "Optional; overrides the test docs file.");
DEFINE_string(test_label, "",
    "Optional; overrides the test labels file.");
DEFINE_string(predict_text, "",
    "Optional; docs to classify, one per line. Labels go to stdout.");
//Other Parameters
DEFINE_int32(num_threads, 0,
    "Optional; overrides the number of evaluation threads if > 0.");

namespace {

void OverrideParam(nbayes::ClassifierParameter* param) {
  if (FLAGS_smoothing > 0) {
    param->set_smoothing(FLAGS_smoothing);
  }
  if (FLAGS_train_text.size()) {
    param->set_train_text(FLAGS_train_text);
  }
  if (FLAGS_train_label.size()) {
    param->set_train_label(FLAGS_train_label);
  }
  if (FLAGS_test_text.size()) {
    param->set_test_text(FLAGS_test_text);
  }
  if (FLAGS_test_label.size()) {
    param->set_test_label(FLAGS_test_label);
  }
  if (FLAGS_num_threads > 0) {
    param->set_num_eval_threads(FLAGS_num_threads);
  }
}

void Run(const nbayes::ClassifierParameter& param) {
  const nbayes::Dataset::LabelMap label_map
      = nbayes::Dataset::MakeLabelMap(param);

  nbayes::Dataset train_data;
  train_data.Init(param.train_text(), param.train_label(), label_map);

  nbayes::NaiveBayes model(param);
  model.Fit(train_data.documents());

  const auto top_words = model.vocab().TopWords(param.display_top_words());
  for (const auto& word : top_words) {
    LOG(INFO) << "Freq word " << word.first << " (" << word.second << ")";
  }

  if (param.test_text().size()) {
    CHECK_GT(param.test_label().size(), 0)
        << "Need test labels to evaluate.";
    nbayes::Dataset test_data;
    test_data.Init(param.test_text(), param.test_label(), label_map);
    const nbayes::ConfusionMatrix matrix
        = model.Evaluate(test_data.documents(), param.num_eval_threads());
    LOG(INFO) << "Confusion matrix:\n" << matrix.ToString();
    for (const auto& cls : model.classes()) {
      LOG(INFO) << cls << ": precision " << matrix.Precision(cls)
          << " recall " << matrix.Recall(cls);
    }
    LOG(INFO) << "Accuracy: " << matrix.Accuracy();
  }

  if (FLAGS_predict_text.size()) {
    std::vector<std::string> texts;
    nbayes::ReadLines(FLAGS_predict_text, &texts);
    for (const auto& text : texts) {
      const nbayes::Prediction prediction = model.Predict(text);
      std::cout << prediction.label << std::endl;
      if (VLOG_IS_ON(1)) {
        const nbayes::DoubleVec log_posteriors = prediction.LogPosteriors();
        std::ostringstream oss;
        for (int c_idx = 0; c_idx < log_posteriors.size(); ++c_idx) {
          oss << prediction.classes[c_idx] << ":"
              << log_posteriors[c_idx] << " ";
        }
        VLOG(1) << oss.str() << "(" << prediction.num_unknown_tokens
            << " unknown tokens)";
      }
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  // Print output to stderr (while still logging).
  FLAGS_alsologtostderr = 1;
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  CHECK_GT(FLAGS_param.size(), 0) << "Need a classifier parameter file.";

  nbayes::ClassifierParameter param;
  nbayes::ReadProtoFromTextFileOrDie(FLAGS_param, &param);
  OverrideParam(&param);
  CHECK_GT(param.train_text().size(), 0) << "Need training docs.";
  CHECK_GT(param.train_label().size(), 0) << "Need training labels.";

  try {
    Run(param);
  } catch (const nbayes::Error& e) {
    LOG(ERROR) << e.what();
    return 1;
  }

  LOG(INFO) << "nbayes finished.";
  return 0;
}
