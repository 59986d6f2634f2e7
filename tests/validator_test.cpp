
#include <gtest/gtest.h>

#include <livemig/validator.hpp>

#include "fakes.hpp"

class PreconditionValidatorTest : public ::testing::Test {

protected:
  FakeHostRegistry registry;
  livemig::PreconditionValidator validator{registry};
};

TEST_F(PreconditionValidatorTest, RunningInstancePasses) {
  auto instance = make_instance();
  EXPECT_FALSE(validator.validate_running(instance).has_value());
}

TEST_F(PreconditionValidatorTest, NonRunningInstanceFails) {
  for(auto state : {livemig::PowerState::PAUSED, livemig::PowerState::SHUTDOWN,
      livemig::PowerState::CRASHED, livemig::PowerState::SUSPENDED, livemig::PowerState::NOSTATE}) {
    auto instance = make_instance("source", 50, state);
    auto failure = validator.validate_running(instance);
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, livemig::ErrorKind::INSTANCE_NOT_RUNNING);
    EXPECT_FALSE(failure->retryable);
    EXPECT_EQ(failure->instance, instance.uuid);
  }
  // Power state is checked without the registry.
  EXPECT_TRUE(registry.lookups.empty());
}

TEST_F(PreconditionValidatorTest, UnknownHostIsUnavailable) {
  auto instance = make_instance();
  auto failure = validator.validate_host_live(instance, "ghost");
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, livemig::ErrorKind::COMPUTE_SERVICE_UNAVAILABLE);
  EXPECT_EQ(failure->host, "ghost");
  EXPECT_FALSE(failure->retryable);
}

TEST_F(PreconditionValidatorTest, DownHostIsUnavailable) {
  registry.add("source", 100, 0, 1.0, "QEMU", livemig::hypervisor_version(5, 0, 0), false);
  auto instance = make_instance();
  auto failure = validator.validate_host_live(instance, "source", true);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->kind, livemig::ErrorKind::COMPUTE_SERVICE_UNAVAILABLE);
  EXPECT_TRUE(failure->retryable);
}

TEST_F(PreconditionValidatorTest, LiveHostPasses) {
  registry.add("source", 100, 0);
  auto instance = make_instance();
  EXPECT_FALSE(validator.validate_host_live(instance, "source").has_value());
  ASSERT_EQ(registry.lookups.size(), 1u);
  EXPECT_EQ(registry.lookups[0], "source");
}

TEST(PowerStateTest, NamesRoundTripAndUnknownIsRejected) {
  EXPECT_EQ(livemig::power_state_serialize(livemig::PowerState::RUNNING), "running");
  EXPECT_EQ(livemig::power_state_deserialize("paused"), livemig::PowerState::PAUSED);
  EXPECT_THROW(livemig::power_state_deserialize("hibernating"), std::runtime_error);
}
