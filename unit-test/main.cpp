#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "config.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // short grace and drain windows keep the deadline tests fast
    testbox::GRACE_WINDOW = std::chrono::milliseconds(200);
    testbox::DRAIN_TIMEOUT = std::chrono::milliseconds(500);
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
