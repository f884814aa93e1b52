#include "gtest/gtest.h"
#include "helpers/TestHelpers.hpp"
#include "opendeploy/BackupStore.hpp"
#include "opendeploy/DeployOrchestrator.hpp"

using namespace opendeploy;
using namespace std::chrono_literals;

class DeployOrchestratorTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        store_ = std::make_unique<BackupStore>((root_ / "appdir").string());
        project_.project_name = "shop";
        project_.environment = "prod";
        project_.local_path = (root_ / "dist").string();
    }

    fs::path snapshotDir() const { return root_ / "appdir" / "backups" / "shop" / "prod"; }

    MockServer server_;
    std::unique_ptr<BackupStore> store_;
    ProjectContext project_;
    RecordingSink sink_;
};

TEST_F(DeployOrchestratorTest, FreshRemoteDeploysTwoFilesWithTwoEvents) {
    createFile(root_ / "dist" / "a.txt", "A");
    createFile(root_ / "dist" / "sub" / "b.txt", "B");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    ASSERT_TRUE(orch.deploy(server_.target(), project_, err)) << err.message;

    ASSERT_EQ(sink_.events.size(), 2u);
    EXPECT_EQ(sink_.events[0].current, 1u);
    EXPECT_DOUBLE_EQ(sink_.events[0].percentage, 50.0);
    EXPECT_EQ(sink_.events[1].current, 2u);
    EXPECT_DOUBLE_EQ(sink_.events[1].percentage, 100.0);

    // Backup was a no-op: directory exists, nothing downloaded
    EXPECT_TRUE(fs::is_directory(snapshotDir()));
    EXPECT_TRUE(fs::is_empty(snapshotDir()));
    EXPECT_TRUE(server_.opsOf("read").empty());

    EXPECT_EQ(server_.fs->fileText("/srv/app/a.txt"), "A");
    EXPECT_EQ(server_.fs->fileText("/srv/app/sub/b.txt"), "B");
    EXPECT_EQ(server_.fs->disconnects, 1);
}

TEST_F(DeployOrchestratorTest, SnapshotIsCapturedBeforeAnyUpload) {
    server_.fs->addFile("/srv/app/index.html", "v1");
    server_.fs->addFile("/srv/app/css/site.css", "old css");
    createFile(root_ / "dist" / "index.html", "v2");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    ASSERT_TRUE(orch.deploy(server_.target(), project_, err)) << err.message;

    EXPECT_EQ(readFile(snapshotDir() / "index.html"), "v1");
    EXPECT_EQ(readFile(snapshotDir() / "css" / "site.css"), "old css");
    EXPECT_EQ(server_.fs->fileText("/srv/app/index.html"), "v2");

    // Every download happens before the first upload
    const auto& ops = server_.fs->ops;
    std::size_t lastRead = 0, firstWrite = ops.size();
    for (std::size_t i = 0; i < ops.size(); ++i) {
        if (ops[i].rfind("read ", 0) == 0) lastRead = i;
        if (ops[i].rfind("write ", 0) == 0 && firstWrite == ops.size()) firstWrite = i;
    }
    ASSERT_EQ(server_.opsOf("read").size(), 2u);
    ASSERT_LT(firstWrite, ops.size());
    EXPECT_LT(lastRead, firstWrite);
}

TEST_F(DeployOrchestratorTest, SnapshotReplacesThePreviousGeneration) {
    std::string dir, e;
    ASSERT_TRUE(store_->locationFor("shop", "prod", dir, e));
    createFile(fs::path(dir) / "stale.txt", "from an older backup");
    server_.fs->addFile("/srv/app/current.txt", "current");
    createFile(root_ / "dist" / "current.txt", "next");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    ASSERT_TRUE(orch.deploy(server_.target(), project_, err)) << err.message;
    EXPECT_FALSE(fs::exists(snapshotDir() / "stale.txt"));
    EXPECT_EQ(readFile(snapshotDir() / "current.txt"), "current");
}

TEST_F(DeployOrchestratorTest, AbsentRemoteKeepsThePreviousSnapshot) {
    std::string dir, e;
    ASSERT_TRUE(store_->locationFor("shop", "prod", dir, e));
    createFile(fs::path(dir) / "good.txt", "last known good");
    createFile(root_ / "dist" / "a.txt", "A");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    ASSERT_TRUE(orch.deploy(server_.target(), project_, err)) << err.message;
    EXPECT_EQ(readFile(snapshotDir() / "good.txt"), "last known good");
}

TEST_F(DeployOrchestratorTest, EmptySourceTreeFailsBeforeNetwork) {
    fs::create_directories(root_ / "dist" / "only" / "dirs");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    EXPECT_FALSE(orch.deploy(server_.target(), project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Path);
    EXPECT_EQ(server_.fs->tcpAttempts, 0);
    EXPECT_TRUE(server_.fs->ops.empty());
    EXPECT_TRUE(sink_.events.empty());
}

TEST_F(DeployOrchestratorTest, MissingLocalPathFailsBeforeNetwork) {
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    EXPECT_FALSE(orch.deploy(server_.target(), project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Path);
    EXPECT_NE(err.message.find("dist"), std::string::npos);
    EXPECT_EQ(server_.fs->tcpAttempts, 0);
}

TEST_F(DeployOrchestratorTest, InvalidProjectNameFailsBeforeNetwork) {
    createFile(root_ / "dist" / "a.txt", "A");
    project_.project_name = "../escape";
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    EXPECT_FALSE(orch.deploy(server_.target(), project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Path);
    EXPECT_EQ(server_.fs->tcpAttempts, 0);
}

TEST_F(DeployOrchestratorTest, RecoversFromTwoTcpFailures) {
    createFile(root_ / "dist" / "a.txt", "A");
    server_.fs->tcpFailuresLeft = 2;
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    ASSERT_TRUE(orch.deploy(server_.target(), project_, err)) << err.message;
    ASSERT_EQ(server_.sleeps.size(), 2u);
    EXPECT_EQ(server_.sleeps[0], 2000ms);
    EXPECT_EQ(server_.sleeps[1], 2000ms);
    EXPECT_EQ(server_.fs->sessionsOpened, 1);
    EXPECT_EQ(server_.fs->fileText("/srv/app/a.txt"), "A");
}

TEST_F(DeployOrchestratorTest, AuthFailureTouchesNothing) {
    createFile(root_ / "dist" / "a.txt", "A");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);
    auto target = server_.target();
    target.password = "nope";

    OperationError err;
    EXPECT_FALSE(orch.deploy(target, project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Auth);
    EXPECT_FALSE(store_->exists("shop", "prod"));
    EXPECT_TRUE(server_.fs->ops.empty());
}

TEST_F(DeployOrchestratorTest, FailedUploadKeepsTheSnapshot) {
    server_.fs->addFile("/srv/app/a.txt", "v1");
    createFile(root_ / "dist" / "a.txt", "v2");
    server_.fs->failWrites.insert("/srv/app/a.txt");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    EXPECT_FALSE(orch.deploy(server_.target(), project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Transfer);
    EXPECT_NE(err.message.find("0/1"), std::string::npos) << err.message;
    EXPECT_EQ(readFile(snapshotDir() / "a.txt"), "v1");
    EXPECT_TRUE(sink_.events.empty());
    EXPECT_EQ(server_.fs->disconnects, 1);
}

TEST_F(DeployOrchestratorTest, FailedBackupStopsBeforeUpload) {
    server_.fs->addFile("/srv/app/a.txt", "v1");
    server_.fs->failReads.insert("/srv/app/a.txt");
    createFile(root_ / "dist" / "a.txt", "v2");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    EXPECT_FALSE(orch.deploy(server_.target(), project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Transfer);
    EXPECT_NE(err.message.find("Backup"), std::string::npos) << err.message;
    EXPECT_TRUE(server_.opsOf("write").empty());
    EXPECT_EQ(server_.fs->fileText("/srv/app/a.txt"), "v1");
}

TEST_F(DeployOrchestratorTest, FailedCaptureKeepsThePreviousSnapshot) {
    std::string dir, e;
    ASSERT_TRUE(store_->locationFor("shop", "prod", dir, e));
    createFile(fs::path(dir) / "good.txt", "last known good");
    server_.fs->addFile("/srv/app/a.txt", "v1");
    server_.fs->addFile("/srv/app/b.txt", "v1 b");
    server_.fs->failReads.insert("/srv/app/b.txt");
    createFile(root_ / "dist" / "a.txt", "v2");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_, &sink_);

    OperationError err;
    EXPECT_FALSE(orch.deploy(server_.target(), project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Transfer);
    EXPECT_EQ(readFile(snapshotDir() / "good.txt"), "last known good");
    EXPECT_FALSE(fs::exists(snapshotDir() / "a.txt"));

    // No staging debris next to the snapshot
    std::size_t siblings = 0;
    for (const auto& entry : fs::directory_iterator(snapshotDir().parent_path())) {
        (void)entry;
        ++siblings;
    }
    EXPECT_EQ(siblings, 1u);
}

TEST_F(DeployOrchestratorTest, FailedStandaloneBackupKeepsThePreviousSnapshot) {
    std::string dir, e;
    ASSERT_TRUE(store_->locationFor("shop", "prod", dir, e));
    createFile(fs::path(dir) / "good.txt", "last known good");
    server_.fs->addFile("/srv/app/sub/a.txt", "v1");
    server_.fs->failLists.insert("/srv/app/sub");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_);

    OperationError err;
    EXPECT_FALSE(orch.backup(server_.target(), project_, err));
    EXPECT_EQ(err.kind, ErrorKind::Transfer);
    EXPECT_EQ(readFile(snapshotDir() / "good.txt"), "last known good");
}

TEST_F(DeployOrchestratorTest, StandaloneBackupMirrorsRemote) {
    server_.fs->addFile("/srv/app/index.html", "live");
    server_.fs->addFile("/srv/app/img/logo.svg", "<svg/>");
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_);

    OperationError err;
    ASSERT_TRUE(orch.backup(server_.target(), project_, err)) << err.message;
    EXPECT_EQ(readFile(snapshotDir() / "index.html"), "live");
    EXPECT_EQ(readFile(snapshotDir() / "img" / "logo.svg"), "<svg/>");
    EXPECT_TRUE(server_.opsOf("write").empty());
    EXPECT_EQ(server_.fs->disconnects, 1);
}

TEST_F(DeployOrchestratorTest, StandaloneBackupOfAbsentRemoteSucceeds) {
    auto conn = server_.manager();
    DeployOrchestrator orch(conn, *store_);

    OperationError err;
    ASSERT_TRUE(orch.backup(server_.target("/srv/never-deployed"), project_, err)) << err.message;
    EXPECT_TRUE(store_->exists("shop", "prod"));
}
