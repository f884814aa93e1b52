#include "gtest/gtest.h"
#include "helpers/TestHelpers.hpp"
#include "DeployController.hpp"
#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>

using namespace opendeploy;

namespace {

struct ProgressSignal {
    int current;
    int total;
    double percentage;
};

struct FinishedSignal {
    bool ok;
    QString message;
};

} // namespace

// Signals arrive queued on the test thread; waitForFinished() spins the loop.
class DeployControllerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        appDir_ = QString::fromStdString((root_ / "appdir").string());
        controller_ = std::make_unique<DeployController>([this] { return server_.manager(); }, appDir_);
        QObject::connect(controller_.get(), &DeployController::progress, &receiver_,
                         [this](int current, int total, double percentage) {
                             progress_.push_back({current, total, percentage});
                         });
        QObject::connect(controller_.get(), &DeployController::finished, &receiver_,
                         [this](bool ok, const QString& message) {
                             finished_.push_back({ok, message});
                             if (loop_) loop_->quit();
                         });
    }

    void TearDown() override {
        settle();
        TempDirTest::TearDown();
    }

    bool waitForFinished(std::size_t count) {
        QEventLoop loop;
        QTimer timeout;
        timeout.setSingleShot(true);
        QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
        timeout.start(10000);
        loop_ = &loop;
        while (finished_.size() < count && timeout.isActive()) loop.exec();
        loop_ = nullptr;
        return finished_.size() >= count;
    }

    // Join every worker and deliver whatever they emitted.
    void settle() {
        controller_.reset();
        QCoreApplication::processEvents();
    }

    QString remote() const { return QStringLiteral("/srv/app"); }
    QString user() const { return QString::fromStdString(server_.fs->user); }
    QString password() const { return QString::fromStdString(server_.fs->password); }
    QString local() const { return QString::fromStdString((root_ / "dist").string()); }

    MockServer server_;
    QString appDir_;
    QObject receiver_;
    QEventLoop* loop_ = nullptr;
    std::unique_ptr<DeployController> controller_;
    std::vector<ProgressSignal> progress_;
    std::vector<FinishedSignal> finished_;
};

TEST_F(DeployControllerTest, DeployForwardsProgressAndFinishesOnce) {
    createFile(root_ / "dist" / "a.txt", "A");
    createFile(root_ / "dist" / "sub" / "b.txt", "B");

    controller_->deploy("shop", local(), "prod", "deploy.example.com", user(), password(), remote());
    ASSERT_TRUE(waitForFinished(1));
    settle();

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_TRUE(finished_[0].ok) << finished_[0].message.toStdString();
    ASSERT_EQ(progress_.size(), 2u);
    EXPECT_EQ(progress_[0].current, 1);
    EXPECT_EQ(progress_[0].total, 2);
    EXPECT_DOUBLE_EQ(progress_[0].percentage, 50.0);
    EXPECT_EQ(progress_[1].current, 2);
    EXPECT_DOUBLE_EQ(progress_[1].percentage, 100.0);
    EXPECT_EQ(server_.fs->fileText("/srv/app/sub/b.txt"), "B");
}

TEST_F(DeployControllerTest, RollbackWithoutBackupReportsOneFailure) {
    createFile(root_ / "dist" / "version.json", "{}");

    controller_->rollback("shop", local(), "prod", "deploy.example.com", user(), password(), remote());
    ASSERT_TRUE(waitForFinished(1));
    settle();

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_FALSE(finished_[0].ok);
    EXPECT_TRUE(finished_[0].message.contains("No backup")) << finished_[0].message.toStdString();
    EXPECT_TRUE(progress_.empty());
}

TEST_F(DeployControllerTest, RejectedPasswordReportsOneFailure) {
    createFile(root_ / "dist" / "a.txt", "A");

    controller_->deploy("shop", local(), "prod", "deploy.example.com", user(), "wrong", remote());
    ASSERT_TRUE(waitForFinished(1));
    settle();

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_FALSE(finished_[0].ok);
    EXPECT_FALSE(finished_[0].message.isEmpty());
    EXPECT_TRUE(server_.fs->ops.empty());
}

TEST_F(DeployControllerTest, BackupCommandWritesIntoAppDir) {
    server_.fs->addFile("/srv/app/index.html", "live");

    controller_->backupRemoteFiles("shop", "prod", "deploy.example.com", user(), password(), remote());
    ASSERT_TRUE(waitForFinished(1));
    settle();

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_TRUE(finished_[0].ok) << finished_[0].message.toStdString();
    EXPECT_EQ(readFile(root_ / "appdir" / "backups" / "shop" / "prod" / "index.html"), "live");
}

TEST_F(DeployControllerTest, FinishedWorkersAreJoinedByTheNextCommand) {
    server_.fs->addFile("/srv/app/index.html", "live");

    for (std::size_t run = 1; run <= 3; ++run) {
        controller_->backupRemoteFiles("shop", "prod", "deploy.example.com", user(), password(), remote());
        // Only the worker just started is left; earlier ones have reported back
        EXPECT_EQ(controller_->workerCount(), 1u);
        ASSERT_TRUE(waitForFinished(run));
    }
    settle();
    EXPECT_EQ(finished_.size(), 3u);
}

TEST_F(DeployControllerTest, BackupDirIsResolvedUnderAppDir) {
    QString dir, err;
    ASSERT_TRUE(controller_->getBackupDir("shop", "prod", dir, err)) << err.toStdString();
    EXPECT_EQ(fs::path(dir.toStdString()), root_ / "appdir" / "backups" / "shop" / "prod");
    EXPECT_TRUE(fs::is_directory(dir.toStdString()));

    EXPECT_FALSE(controller_->getBackupDir("..", "prod", dir, err));
    EXPECT_FALSE(err.isEmpty());
}
