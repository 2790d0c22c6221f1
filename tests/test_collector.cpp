#include "mqm_collector/collector.h"
#include "mqm_collector/errors.h"
#include "test_fakes.h"

#include <gtest/gtest.h>

namespace mqm_collector {

class CollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = default_config();
        config_.registry.path = dir_.file("queue_manager_cache.json");
        config_.mq.mqm_path   = dir_.path();
        for (const char* tool : {"dspmq", "dspmqcsv", "runmqsc"}) dir_.add_tool(tool);
    }

    CollectionResult run(StatusKind kind, const std::string& user = "mqm", bool sudo_ok = false) {
        Collector collector(config_, std::make_unique<FakePrivilegeBridge>(
                                         config_.mq, user, sudo_ok, fake_));
        return collector.run(kind);
    }

    void write_registry(const std::string& content) {
        dir_.write("queue_manager_cache.json", content);
    }

    TempDir                               dir_;
    Config                                config_;
    std::shared_ptr<FakeExecutionContext> fake_ = std::make_shared<FakeExecutionContext>();
};

TEST_F(CollectorTest, NoActiveManagersYieldsEmptyArrayForEveryKind) {
    write_registry(R"([{"Q_MANAGER":"QM2","Q_STATUS":0}])");
    for (auto kind : {StatusKind::CommandServer, StatusKind::DeadLetter,
                      StatusKind::OldestMessage, StatusKind::Listener}) {
        // Denied bridge: the privilege check is never reached
        auto result = run(kind, "zabbix", false);
        EXPECT_EQ(result.payload, "[]") << status_kind_name(kind);
        EXPECT_EQ(result.exit_code, 0);
    }
    EXPECT_EQ(fake_->probes, 0);
    EXPECT_TRUE(fake_->calls.empty());
}

TEST_F(CollectorTest, MissingRegistryExitsTwo) {
    auto result = run(StatusKind::Listener);
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.payload,
              R"({"error":"The file ')" + config_.registry.path + R"(' does not exist."})");
}

TEST_F(CollectorTest, MalformedRegistryExitsThree) {
    write_registry("{broken");
    auto result = run(StatusKind::DeadLetter);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.payload, R"({"error":"Failed to parse queue manager cache file"})");
}

TEST_F(CollectorTest, PrivilegeDeniedExitsThreeBeforeAnyQuery) {
    write_registry(R"([{"Q_MANAGER":"QM1","Q_STATUS":1}])");
    auto result = run(StatusKind::Listener, "zabbix", false);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.payload,
              R"({"error":"Cannot run as mqm non-interactively (configure sudoers)."})");
    EXPECT_TRUE(fake_->calls.empty());
}

TEST_F(CollectorTest, MissingToolExitsOne) {
    write_registry(R"([{"Q_MANAGER":"QM1","Q_STATUS":1}])");
    std::filesystem::remove(dir_.file("dspmqcsv"));
    auto result = run(StatusKind::CommandServer);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.payload,
              R"({"error":"dspmqcsv command not found. Please ensure IBM MQ is installed and in PATH."})");
    EXPECT_TRUE(fake_->calls.empty());
}

TEST_F(CollectorTest, ListenerCollectionForActiveManagers) {
    write_registry(R"([{"Q_MANAGER":"QM1","Q_STATUS":1},{"Q_MANAGER":"QM2","Q_STATUS":0}])");
    fake_->on_mqsc("QM1", "DISPLAY LSSTATUS(*)",
                   "   LISTENER(L1)   STATUS(RUNNING)\n"
                   "   LISTENER(L2)   STATUS(RUNNING)\n");

    auto result = run(StatusKind::Listener, "zabbix", true);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.payload, R"([{"Q_MANAGER":"QM1","Q_COUNT":2,"LISTENER":"L1,L2"}])");
    EXPECT_FALSE(fake_->was_called_with("QM2"));
}

TEST_F(CollectorTest, InvalidRegistryNameDoesNotAbortBatch) {
    write_registry(R"([{"Q_MANAGER":"bad name!","Q_STATUS":1},{"Q_MANAGER":"QM1","Q_STATUS":1}])");
    fake_->on_dspmqcsv("QM1", "AMQ8027I: IBM MQ Command Server Status ..: Running\n");

    auto result = run(StatusKind::CommandServer);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.payload,
              R"([{"Q_MANAGER":"bad name!","Q_STATUS":"INVALID"},{"Q_MANAGER":"QM1","Q_STATUS":"1"}])");
    EXPECT_FALSE(fake_->was_called_with("bad name!"));
}

TEST_F(CollectorTest, ManagerCollectionRefreshesRegistry) {
    fake_->on_dspmq("QMNAME(QM1)     STATUS(Running)\n"
                    "QMNAME(QM2)     STATUS(Ended immediately)\n");

    auto result = run(StatusKind::Manager, "zabbix", false);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.payload,
              R"([{"Q_MANAGER":"QM1","Q_STATUS":1},{"Q_MANAGER":"QM2","Q_STATUS":0}])");
    EXPECT_EQ(dir_.read("queue_manager_cache.json"), result.payload + "\n");

    // Other collectors see the new snapshot
    fake_->on_dspmqcsv("QM1", "Running\n");
    auto cs = run(StatusKind::CommandServer);
    EXPECT_EQ(cs.payload, R"([{"Q_MANAGER":"QM1","Q_STATUS":"1"}])");
}

TEST_F(CollectorTest, ManagerCollectionWithUnwritableDirectoryExitsTwo) {
    config_.registry.path = dir_.file("missing/queue_manager_cache.json");
    auto result = run(StatusKind::Manager);
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.payload,
              R"({"error":"Directory ')" + dir_.file("missing") + R"(' does not exist."})");
    EXPECT_TRUE(fake_->calls.empty());
}

TEST_F(CollectorTest, ManagerCollectionMissingDspmqExitsOne) {
    std::filesystem::remove(dir_.file("dspmq"));
    auto result = run(StatusKind::Manager);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(std::filesystem::exists(config_.registry.path));
}

} // namespace mqm_collector
