
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "../server/conductor/conductor.hpp"
#include "../server/conductor/settings.hpp"
#include "config.h"

using livemig::conductor::ClusterDB;

const std::string RUNNING_INSTANCE = "4b7e7a5c-0c0e-4d0b-9f59-1f8f0e1c2a01";
const std::string STOPPED_INSTANCE = "9d1f3c2e-7a44-4c1b-8e0a-55d2b6c3fa02";

class ConductorTest : public ::testing::Test {

protected:
  ClusterDB database;

  void SetUp() override
  {
    database.read(Settings::CLUSTER_DB_PATH);
  }

  livemig::MigrationRequest request(std::optional<std::string> destination = std::nullopt,
      bool block_migration = false, bool disk_over_commit = false)
  {
    return livemig::MigrationRequest{RUNNING_INSTANCE, destination, block_migration, disk_over_commit};
  }
};

TEST(SettingsTest, ReadConfiguration) {
  std::ifstream in{Settings::CONDUCTOR_CONFIG_PATH};
  ASSERT_TRUE(in.is_open());

  auto settings = livemig::conductor::Settings::deserialize(in);
  EXPECT_EQ(settings.http_network_port, 10000);
  EXPECT_EQ(settings.http_threads, 2);
  EXPECT_TRUE(settings.options().unlimited_retries());
}

TEST(SettingsTest, InvalidValuesAreRejected) {
  std::istringstream retries{R"({"config": {
    "http_network_address": "127.0.0.1", "http_network_port": 10000,
    "http-threads": 1, "migrate_max_retries": -3
  }})"};
  EXPECT_THROW(livemig::conductor::Settings::deserialize(retries), std::runtime_error);

  std::istringstream threads{R"({"config": {
    "http_network_address": "127.0.0.1", "http_network_port": 10000,
    "http-threads": 0, "migrate_max_retries": 3
  }})"};
  EXPECT_THROW(livemig::conductor::Settings::deserialize(threads), std::runtime_error);
}

TEST_F(ConductorTest, DatabaseContents) {
  EXPECT_EQ(database.hosts().size(), 7u);
  auto record = database.instance(RUNNING_INSTANCE);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->instance.host, "compute-1");
  EXPECT_TRUE(record->instance.is_running());
  EXPECT_EQ(record->instance.flavor.disk_gb(), 40);
  EXPECT_EQ(database.host("compute-1")->facts.hypervisor_version, livemig::hypervisor_version(2, 11, 0));
  EXPECT_EQ(database.host("compute-3")->facts.hypervisor_version, livemig::hypervisor_version(1, 5, 3));

  auto image = database.image("cirros-0.6.2");
  ASSERT_TRUE(image.has_value());
  EXPECT_EQ(image->at("os_type"), "linux");
  EXPECT_TRUE(database.migrations().empty());

  EXPECT_THROW(database.read("/nonexistent/cluster.json"), std::runtime_error);
}

TEST_F(ConductorTest, HostUpdates) {
  EXPECT_EQ(database.update_host("compute-2", false, std::nullopt), ClusterDB::ResultCode::OK);
  EXPECT_FALSE(database.host("compute-2")->facts.up);
  EXPECT_EQ(database.update_host("compute-2", std::nullopt, -1), ClusterDB::ResultCode::MALFORMED_DATA);
  EXPECT_EQ(database.update_host("compute-9", true, std::nullopt), ClusterDB::ResultCode::HOST_DOESNT_EXIST);

  livemig::conductor::HostRecord record = *database.host("compute-1");
  EXPECT_EQ(database.add_host(record), ClusterDB::ResultCode::HOST_EXISTS);
  record.facts.host = "";
  EXPECT_EQ(database.add_host(record), ClusterDB::ResultCode::MALFORMED_DATA);

  EXPECT_EQ(database.remove_host("compute-7"), ClusterDB::ResultCode::OK);
  EXPECT_EQ(database.remove_host("compute-7"), ClusterDB::ResultCode::HOST_DOESNT_EXIST);
}

TEST_F(ConductorTest, SchedulerRanksByFreeMemory) {
  livemig::conductor::LocalScheduler scheduler{database};
  livemig::RequestSpec spec;

  livemig::FilterProperties filter;
  filter.ignore_hosts = {"compute-1"};
  EXPECT_EQ(scheduler.select_destination(spec, filter).value_or(""), "compute-5");

  filter.ignore_hosts = {"compute-1", "compute-5", "compute-3"};
  EXPECT_EQ(scheduler.select_destination(spec, filter).value_or(""), "compute-7");

  // compute-4 is down
  filter.ignore_hosts = {"compute-1", "compute-2", "compute-3", "compute-5", "compute-6", "compute-7"};
  EXPECT_FALSE(scheduler.select_destination(spec, filter).has_value());

  EXPECT_DOUBLE_EQ(livemig::conductor::LocalScheduler::free_memory(database.host("compute-2")->facts), 45056.0);
}

TEST_F(ConductorTest, ComputePrecheckStorage) {
  livemig::conductor::LocalCompute compute{database};
  auto instance = database.instance(RUNNING_INSTANCE)->instance;

  auto shared = compute.check_can_live_migrate_destination(instance, "compute-2", false, false);
  ASSERT_TRUE(shared.migrate_data.has_value());
  auto data = livemig::conductor::LiveMigrateData::decode(*shared.migrate_data);
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ(data->destination, "compute-2");
  EXPECT_TRUE(data->is_shared_storage);

  EXPECT_FALSE(compute.check_can_live_migrate_destination(instance, "compute-2", true, false).migrate_data.has_value());
  EXPECT_FALSE(compute.check_can_live_migrate_destination(instance, "compute-7", false, false).migrate_data.has_value());
  // 20 GB free for a 40 GB disk
  auto disk = compute.check_can_live_migrate_destination(instance, "compute-7", true, false);
  EXPECT_FALSE(disk.migrate_data.has_value());
  EXPECT_NE(disk.reason.find("Lack of disk"), std::string::npos);
  EXPECT_TRUE(compute.check_can_live_migrate_destination(instance, "compute-7", true, true).migrate_data.has_value());
  EXPECT_FALSE(compute.check_can_live_migrate_destination(instance, "compute-4", false, false).migrate_data.has_value());
}

TEST_F(ConductorTest, ComputeRefusesForeignMigrateData) {
  livemig::conductor::LocalCompute compute{database};
  auto instance = database.instance(RUNNING_INSTANCE)->instance;

  auto issued = compute.check_can_live_migrate_destination(instance, "compute-2", false, false);
  ASSERT_TRUE(issued.migrate_data.has_value());
  auto ack = compute.live_migration("compute-1", instance, "compute-3", false, *issued.migrate_data);
  EXPECT_FALSE(ack.accepted);

  ack = compute.live_migration("compute-1", instance, "compute-2", false, livemig::MigrateData{R"({"other": 1})"});
  EXPECT_FALSE(ack.accepted);
  EXPECT_TRUE(database.migrations().empty());
}

TEST_F(ConductorTest, ScheduledMigrationCompletes) {
  livemig::conductor::Conductor conductor{database, livemig::Options{}};

  auto outcome = conductor.migrate(request());
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(outcome->succeeded()) << outcome->failure->describe();
  EXPECT_EQ(outcome->destination, "compute-2");

  auto migrations = database.migrations();
  ASSERT_EQ(migrations.size(), 1u);
  EXPECT_STREQ(migrations[0].status.c_str(), livemig::conductor::MigrationRecord::ACCEPTED);
  EXPECT_EQ(database.instance(RUNNING_INSTANCE)->task_state, livemig::conductor::InstanceRecord::TASK_MIGRATING);

  EXPECT_EQ(conductor.compute().process_pending(), 1);

  auto record = database.instance(RUNNING_INSTANCE);
  EXPECT_EQ(record->instance.host, "compute-2");
  EXPECT_TRUE(record->task_state.empty());
  EXPECT_EQ(database.host("compute-1")->facts.memory_mb_used, 4096);
  EXPECT_EQ(database.host("compute-2")->facts.memory_mb_used, 8192);
  EXPECT_STREQ(database.migrations()[0].status.c_str(), livemig::conductor::MigrationRecord::COMPLETED);
}

TEST_F(ConductorTest, MigrationFailsWhenDestinationVanishes) {
  livemig::conductor::Conductor conductor{database, livemig::Options{}};

  ASSERT_TRUE(conductor.migrate(request("compute-2"))->succeeded());
  ASSERT_EQ(database.remove_host("compute-2"), ClusterDB::ResultCode::OK);
  EXPECT_EQ(conductor.compute().process_pending(), 1);

  auto migrations = database.migrations();
  ASSERT_EQ(migrations.size(), 1u);
  EXPECT_STREQ(migrations[0].status.c_str(), livemig::conductor::MigrationRecord::ERROR);
  auto record = database.instance(RUNNING_INSTANCE);
  EXPECT_EQ(record->instance.host, "compute-1");
  EXPECT_TRUE(record->task_state.empty());
  EXPECT_EQ(database.host("compute-1")->facts.memory_mb_used, 8192);

  // Released instance can be migrated again.
  EXPECT_TRUE(conductor.migrate(request("compute-7", true, true))->succeeded());
}

TEST_F(ConductorTest, FailMigrationOnlyForAcceptedRecords) {
  int32_t id = -1;
  ASSERT_EQ(
    database.begin_migration(RUNNING_INSTANCE, "compute-1", "compute-2", false, id),
    ClusterDB::ResultCode::OK
  );
  EXPECT_EQ(database.fail_migration(id), ClusterDB::ResultCode::OK);
  EXPECT_EQ(database.fail_migration(id), ClusterDB::ResultCode::INVALID_STATE);
  EXPECT_EQ(database.complete_migration(id), ClusterDB::ResultCode::INVALID_STATE);
  EXPECT_EQ(database.fail_migration(42), ClusterDB::ResultCode::INVALID_STATE);
}

TEST_F(ConductorTest, WorkerLifecycle) {
  livemig::conductor::Conductor conductor{database, livemig::Options{}};
  auto & compute = conductor.compute();

  compute.start();
  // Second start keeps the running worker.
  compute.start();
  EXPECT_THROW(compute.process_pending(), std::logic_error);

  ASSERT_TRUE(conductor.migrate(request())->succeeded());
  compute.shutdown();

  // Shutdown drains the queue before the worker exits.
  EXPECT_EQ(database.instance(RUNNING_INSTANCE)->instance.host, "compute-2");
  EXPECT_STREQ(database.migrations()[0].status.c_str(), livemig::conductor::MigrationRecord::COMPLETED);
  EXPECT_EQ(compute.process_pending(), 0);
}

TEST_F(ConductorTest, RetryBudgetOfConductor) {
  // compute-5, compute-3 and compute-7 are rejected before compute-2.
  {
    livemig::conductor::Conductor conductor{database, livemig::Options{2}};
    auto outcome = conductor.migrate(request());
    ASSERT_FALSE(outcome->succeeded());
    EXPECT_EQ(outcome->failure->kind, livemig::ErrorKind::NO_VALID_HOST);
  }
  {
    livemig::conductor::Conductor conductor{database, livemig::Options{3}};
    auto outcome = conductor.migrate(request());
    ASSERT_TRUE(outcome->succeeded());
    EXPECT_EQ(outcome->destination, "compute-2");
  }
}

TEST_F(ConductorTest, ExplicitDestinationFailures) {
  livemig::conductor::Conductor conductor{database, livemig::Options{}};

  auto outcome = conductor.migrate(request("compute-6"));
  ASSERT_FALSE(outcome->succeeded());
  EXPECT_EQ(outcome->failure->kind, livemig::ErrorKind::MIGRATION_PRECHECK_ERROR);

  outcome = conductor.migrate(request("compute-4"));
  ASSERT_FALSE(outcome->succeeded());
  EXPECT_EQ(outcome->failure->kind, livemig::ErrorKind::COMPUTE_SERVICE_UNAVAILABLE);

  outcome = conductor.migrate(request("compute-7", true, false));
  ASSERT_FALSE(outcome->succeeded());
  EXPECT_EQ(outcome->failure->kind, livemig::ErrorKind::MIGRATION_PRECHECK_REJECTED);
  EXPECT_FALSE(outcome->failure->retryable);

  EXPECT_TRUE(database.migrations().empty());
}

TEST_F(ConductorTest, BlockMigrationMovesDisk) {
  livemig::conductor::Conductor conductor{database, livemig::Options{}};

  auto outcome = conductor.migrate(request("compute-7", true, true));
  ASSERT_TRUE(outcome->succeeded());
  EXPECT_EQ(conductor.compute().process_pending(), 1);

  EXPECT_EQ(database.host("compute-7")->free_disk_gb, 0);
  EXPECT_EQ(database.host("compute-1")->free_disk_gb, 540);
  EXPECT_TRUE(database.migrations()[0].block_migration);
}

TEST_F(ConductorTest, UnknownAndStoppedInstances) {
  livemig::conductor::Conductor conductor{database, livemig::Options{}};

  livemig::MigrationRequest unknown{"00000000-0000-4000-8000-000000000000", std::nullopt, false, false};
  EXPECT_FALSE(conductor.migrate(unknown).has_value());

  livemig::MigrationRequest stopped{STOPPED_INSTANCE, std::string{"compute-2"}, false, false};
  auto outcome = conductor.migrate(stopped);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(outcome->failure->kind, livemig::ErrorKind::INSTANCE_NOT_RUNNING);
}

TEST_F(ConductorTest, SecondMigrationWhileInFlight) {
  livemig::conductor::Conductor conductor{database, livemig::Options{}};

  ASSERT_TRUE(conductor.migrate(request())->succeeded());
  auto second = conductor.migrate(request());
  ASSERT_FALSE(second->succeeded());
  EXPECT_EQ(second->failure->kind, livemig::ErrorKind::DISPATCH_FAILED);
  EXPECT_EQ(database.migrations().size(), 1u);
}

TEST_F(ConductorTest, InvalidRetryLimit) {
  EXPECT_THROW(livemig::conductor::Conductor(database, livemig::Options{-2}), std::runtime_error);
}

TEST_F(ConductorTest, DatabaseRoundTripKeepsHistory) {
  {
    livemig::conductor::Conductor conductor{database, livemig::Options{}};
    ASSERT_TRUE(conductor.migrate(request())->succeeded());
    conductor.compute().process_pending();
  }

  std::stringstream stream;
  database.write(stream);

  ClusterDB restored;
  restored.read(stream);
  EXPECT_EQ(restored.hosts().size(), 7u);
  EXPECT_EQ(restored.instance(RUNNING_INSTANCE)->instance.host, "compute-2");
  EXPECT_EQ(restored.host("compute-2")->facts.memory_mb_used, 8192);
  ASSERT_EQ(restored.migrations().size(), 1u);

  // Identifiers continue after the restored history.
  int32_t id = -1;
  EXPECT_EQ(
    restored.begin_migration(RUNNING_INSTANCE, "compute-2", "compute-1", false, id),
    ClusterDB::ResultCode::OK
  );
  EXPECT_EQ(id, 1);
}
