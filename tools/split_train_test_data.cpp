
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "nbayes.hpp"
#include "random.hpp"
#include "util.hpp"
#include <ctime>

using namespace std;
using namespace nbayes;

DEFINE_string(text, "", "Filename of the docs, one per line");
DEFINE_string(label, "", "Filename of the labels, one per line");
DEFINE_int32(percent, 10, "Takes percent% data as test data");
DEFINE_int32(random_seed, -1, "Use system time as rand seed by default.");

int main(int argc, char** argv) {
  FLAGS_logtostderr = 1;
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  CHECK_GT(FLAGS_text.size(), 0) << "Need a docs file.";
  CHECK_GT(FLAGS_label.size(), 0) << "Need a labels file.";
  CHECK_GE(FLAGS_percent, 0);
  CHECK_LE(FLAGS_percent, 100);

  vector<string> texts, labels;
  ReadLines(FLAGS_text, &texts);
  ReadLines(FLAGS_label, &labels);
  CHECK_EQ(texts.size(), labels.size())
      << "Docs and labels have different line counts";

  const int num_doc = texts.size();
  const int num_test = percent_of(num_doc, FLAGS_percent);
  const int num_train = num_doc - num_test;
  LOG(INFO) << "Total number of docs: " << num_doc
      << " #train: " << num_train << " #test: " << num_test;

  Random random(FLAGS_random_seed >= 0 ? FLAGS_random_seed : time(NULL));
  vector<int> order(num_doc);
  for (int d_idx = 0; d_idx < num_doc; ++d_idx) {
    order[d_idx] = d_idx;
  }
  random.shuffle(order);

  vector<string> train_texts, train_labels, test_texts, test_labels;
  for (int i = 0; i < num_doc; ++i) {
    const int d_idx = order[i];
    if (i < num_test) {
      test_texts.push_back(texts[d_idx]);
      test_labels.push_back(labels[d_idx]);
    } else {
      train_texts.push_back(texts[d_idx]);
      train_labels.push_back(labels[d_idx]);
    }
  }

  WriteLines(train_texts, FLAGS_text + ".train");
  WriteLines(train_labels, FLAGS_label + ".train");
  WriteLines(test_texts, FLAGS_text + ".test");
  WriteLines(test_labels, FLAGS_label + ".test");

  LOG(INFO) << "Data splitting done.";

  return 0;
}
