#include "mqm_collector/errors.h"
#include "mqm_collector/registry_store.h"
#include "mqm_collector/scratch_file.h"
#include "test_fakes.h"

#include <gtest/gtest.h>

namespace mqm_collector {

class RegistryStoreTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(RegistryStoreTest, ActiveManagersInRegistryOrder) {
    std::vector<ManagerStatus> snapshot{
        {"QM3", manager_state::RUNNING},
        {"QM1", manager_state::NOT_RUNNING},
        {"QM2", manager_state::STANDBY_RUNNING},
        {"QM4", manager_state::RUNNING},
    };
    EXPECT_EQ(active_managers(snapshot), (std::vector<std::string>{"QM3", "QM4"}));
}

TEST_F(RegistryStoreTest, ResolveReturnsOnlyRunning) {
    auto path = dir_.write("qm.json",
                           R"([{"Q_MANAGER":"QM1","Q_STATUS":1},{"Q_MANAGER":"QM2","Q_STATUS":0}])");
    RegistryStore store(path);
    EXPECT_EQ(resolve_active_managers(store), (std::vector<std::string>{"QM1"}));
}

TEST_F(RegistryStoreTest, NoneRunningResolvesToEmpty) {
    auto path = dir_.write("qm.json", R"([{"Q_MANAGER":"QM2","Q_STATUS":0}])");
    EXPECT_TRUE(resolve_active_managers(RegistryStore(path)).empty());

    path = dir_.write("empty.json", "[]\n");
    EXPECT_TRUE(resolve_active_managers(RegistryStore(path)).empty());
}

TEST_F(RegistryStoreTest, ResolveIsStableForUnchangedRegistry) {
    auto path = dir_.write("qm.json",
                           R"([{"Q_MANAGER":"QM2","Q_STATUS":1},{"Q_MANAGER":"QM1","Q_STATUS":0},)"
                           R"({"Q_MANAGER":"QM3","Q_STATUS":1}])");
    RegistryStore store(path);
    auto first = resolve_active_managers(store);
    EXPECT_EQ(first, (std::vector<std::string>{"QM2", "QM3"}));
    EXPECT_EQ(resolve_active_managers(store), first);
}

TEST_F(RegistryStoreTest, NonIntegerOrOutOfRangeStatusIsNotRunning) {
    auto path = dir_.write("qm.json",
                           R"([{"Q_MANAGER":"QM9","Q_STATUS":1.5},)"
                           R"({"Q_MANAGER":"QMX","Q_STATUS":4294967297},)"
                           R"({"Q_MANAGER":"QMY","Q_STATUS":-1},)"
                           R"({"Q_MANAGER":"QMZ","Q_STATUS":"1"},)"
                           R"({"Q_MANAGER":"QM1","Q_STATUS":1}])");
    RegistryStore store(path);
    auto snapshot = store.load();

    ASSERT_EQ(snapshot.size(), 5u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(snapshot[i].state, manager_state::NOT_RUNNING) << snapshot[i].name;
    }
    EXPECT_EQ(active_managers(snapshot), (std::vector<std::string>{"QM1"}));
}

TEST_F(RegistryStoreTest, StandbyStatusKept) {
    auto path = dir_.write("qm.json", R"([{"Q_MANAGER":"QM2","Q_STATUS":2}])");
    auto snapshot = RegistryStore(path).load();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].state, manager_state::STANDBY_RUNNING);
}

TEST_F(RegistryStoreTest, MissingFileIsMissingRegistry) {
    RegistryStore store(dir_.file("absent.json"));
    try {
        (void)store.load();
        FAIL() << "expected CollectorError";
    } catch (const CollectorError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingRegistry);
        EXPECT_EQ(e.exit_code(), 2);
        EXPECT_EQ(std::string(e.what()), "The file '" + store.path() + "' does not exist.");
    }
}

TEST_F(RegistryStoreTest, MalformedContentIsParseFailure) {
    for (const char* content : {"not json", R"({"Q_MANAGER":"QM1"})", "[1,2]",
                                R"([{"Q_STATUS":1}])", ""}) {
        RegistryStore store(dir_.write("bad.json", content));
        try {
            (void)store.load();
            ADD_FAILURE() << "expected parse failure for: " << content;
        } catch (const CollectorError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::RegistryParseFailure);
            EXPECT_EQ(e.exit_code(), 3);
        }
    }
}

TEST_F(RegistryStoreTest, StoppedEntryWithoutNameIsTolerated) {
    auto path = dir_.write("qm.json", R"([{"Q_STATUS":0},{"Q_MANAGER":"QM1","Q_STATUS":1}])");
    EXPECT_EQ(resolve_active_managers(RegistryStore(path)), (std::vector<std::string>{"QM1"}));
}

TEST_F(RegistryStoreTest, ReplaceWritesWireFormat) {
    RegistryStore store(dir_.file("qm.json"));
    store.replace({{"QM1", 1}, {"QM2", 0}});

    EXPECT_EQ(dir_.read("qm.json"),
              "[{\"Q_MANAGER\":\"QM1\",\"Q_STATUS\":1},{\"Q_MANAGER\":\"QM2\",\"Q_STATUS\":0}]\n");
    EXPECT_EQ(active_managers(store.load()), (std::vector<std::string>{"QM1"}));
}

TEST_F(RegistryStoreTest, ReplaceIsIdempotentAndLeavesNoScratchFile) {
    RegistryStore store(dir_.file("qm.json"));
    std::vector<ManagerStatus> snapshot{{"QM1", 1}, {"QM2", 2}};
    store.replace(snapshot);
    auto first = dir_.read("qm.json");
    store.replace(snapshot);
    EXPECT_EQ(dir_.read("qm.json"), first);

    for (const auto& entry : std::filesystem::directory_iterator(dir_.path())) {
        EXPECT_EQ(entry.path().filename().string().find(".tmp."), std::string::npos)
            << entry.path();
    }
}

TEST_F(RegistryStoreTest, EnsureWritableRejectsMissingDirectory) {
    RegistryStore store(dir_.file("nowhere/qm.json"));
    try {
        store.ensure_writable();
        FAIL() << "expected CollectorError";
    } catch (const CollectorError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RegistryUnwritable);
        EXPECT_EQ(e.exit_code(), 2);
        EXPECT_EQ(std::string(e.what()), "Directory '" + dir_.file("nowhere") + "' does not exist.");
    }
}

TEST_F(RegistryStoreTest, EnsureWritableAcceptsTempDir) {
    RegistryStore store(dir_.file("qm.json"));
    EXPECT_NO_THROW(store.ensure_writable());
}

TEST(ScratchFileTest, UncommittedFileIsRemoved) {
    TempDir dir;
    std::string scratch_path;
    {
        ScratchFile scratch(dir.file("target.json"));
        scratch.write("partial");
        scratch_path = scratch.path();
        EXPECT_TRUE(std::filesystem::exists(scratch_path));
        EXPECT_NE(scratch_path.find("target.json.tmp."), std::string::npos);
    }
    EXPECT_FALSE(std::filesystem::exists(scratch_path));
    EXPECT_FALSE(std::filesystem::exists(dir.file("target.json")));
}

TEST(ScratchFileTest, CommitReplacesTarget) {
    TempDir dir;
    dir.write("target.json", "old");
    ScratchFile scratch(dir.file("target.json"));
    scratch.write("new");
    scratch.commit();

    EXPECT_TRUE(scratch.committed());
    EXPECT_EQ(dir.read("target.json"), "new");
    EXPECT_FALSE(std::filesystem::exists(scratch.path()));
}

TEST(ScratchFileTest, CommitWithoutWriteThrows) {
    TempDir dir;
    ScratchFile scratch(dir.file("target.json"));
    EXPECT_THROW(scratch.commit(), std::runtime_error);
}

} // namespace mqm_collector
