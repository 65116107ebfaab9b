// The main nbayes test code. Your test cpp code should include this hpp
// to allow a main function to be compiled into the binary.

#include <gtest/gtest.h>
#include "common.hpp"

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;
  return RUN_ALL_TESTS();
}
