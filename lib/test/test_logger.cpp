#include "Logger.h"
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace {

// Keeps every record it receives
class CaptureHandler : public pos::logging::Handler {
public:
  struct Record {
    pos::logging::Level level;
    std::string loggerName;
    std::string message;
  };

  void emit(pos::logging::Level level, const std::string &loggerName,
            const std::string &message) override {
    if (level < level_) {
      return;
    }
    records.push_back({ level, loggerName, message });
  }

  std::vector<Record> records;
};

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
  auto rootLogger = pos::logging::getRootLogger();
  EXPECT_EQ(rootLogger.getName(), "");
  EXPECT_NO_THROW({
    rootLogger.debug << "Debug message";
    rootLogger.info << "Info message";
    rootLogger.warning << "Warning message";
    rootLogger.error << "Error message";
    rootLogger.critical << "Critical message";
  });
}

TEST(LoggerTest, NamedLoggerHasCorrectName) {
  auto namedLogger = pos::logging::getLogger("myapp");
  EXPECT_EQ(namedLogger.getName(), "myapp");
  EXPECT_EQ(namedLogger.getFullName(), "myapp");
}

TEST(LoggerTest, SameNameSharesNode) {
  auto a = pos::logging::getLogger("shared_node");
  auto b = pos::logging::getLogger("shared_node");
  EXPECT_EQ(a, b);
  a.setLevel(pos::logging::Level::ERROR);
  EXPECT_EQ(b.getLevel(), pos::logging::Level::ERROR);
}

TEST(LoggerTest, StreamFormatsValues) {
  auto logger = pos::logging::getLogger("format_test");
  logger.setPropagate(false);
  auto spCapture = std::make_shared<CaptureHandler>();
  logger.addHandler(spCapture);

  logger.info << "value=" << 42 << " ratio=" << 0.5;

  ASSERT_EQ(spCapture->records.size(), 1u);
  EXPECT_EQ(spCapture->records[0].level, pos::logging::Level::INFO);
  EXPECT_EQ(spCapture->records[0].loggerName, "format_test");
  EXPECT_NE(spCapture->records[0].message.find("value=42 ratio=0.5"),
            std::string::npos);
  EXPECT_NE(spCapture->records[0].message.find("[INFO]"), std::string::npos);
}

TEST(LoggerTest, LoggingLevelFiltersMessages) {
  auto levelLogger = pos::logging::getLogger("level_test");
  levelLogger.setPropagate(false);
  levelLogger.setLevel(pos::logging::Level::WARNING);
  auto spCapture = std::make_shared<CaptureHandler>();
  levelLogger.addHandler(spCapture);

  levelLogger.debug << "Debug message";
  levelLogger.info << "Info message";
  levelLogger.warning << "Warning message";
  levelLogger.error << "Error message";

  ASSERT_EQ(spCapture->records.size(), 2u);
  EXPECT_EQ(spCapture->records[0].level, pos::logging::Level::WARNING);
  EXPECT_EQ(spCapture->records[1].level, pos::logging::Level::ERROR);
}

TEST(LoggerTest, HandlerLevelFiltersMessages) {
  auto logger = pos::logging::getLogger("handler_level_test");
  logger.setPropagate(false);
  auto spCapture = std::make_shared<CaptureHandler>();
  spCapture->setLevel(pos::logging::Level::ERROR);
  logger.addHandler(spCapture);

  logger.warning << "dropped";
  logger.critical << "kept";

  ASSERT_EQ(spCapture->records.size(), 1u);
  EXPECT_EQ(spCapture->records[0].level, pos::logging::Level::CRITICAL);
}

TEST(LoggerTest, HierarchicalLoggerCreatesTree) {
  auto child = pos::logging::getLogger("treeA.treeB.treeC");
  auto parent = pos::logging::getLogger("treeA.treeB");

  EXPECT_EQ(child.getName(), "treeC");
  EXPECT_EQ(child.getFullName(), "treeA.treeB.treeC");
  EXPECT_EQ(parent.getFullName(), "treeA.treeB");
}

TEST(LoggerTest, RecordsPropagateToParent) {
  auto parent = pos::logging::getLogger("propagate_parent");
  parent.setPropagate(false);
  auto spCapture = std::make_shared<CaptureHandler>();
  parent.addHandler(spCapture);

  auto child = pos::logging::getLogger("propagate_parent.child");
  child.info << "from child";

  ASSERT_EQ(spCapture->records.size(), 1u);
  EXPECT_EQ(spCapture->records[0].loggerName, "propagate_parent.child");

  child.setPropagate(false);
  child.info << "stays in child";
  EXPECT_EQ(spCapture->records.size(), 1u);
}

TEST(LoggerTest, ParentLevelFiltersChildRecords) {
  auto parent = pos::logging::getLogger("filter_parent");
  parent.setPropagate(false);
  parent.setLevel(pos::logging::Level::WARNING);
  auto spCapture = std::make_shared<CaptureHandler>();
  parent.addHandler(spCapture);

  auto child = pos::logging::getLogger("filter_parent.child");
  child.info << "filtered by parent";
  child.error << "passes";

  ASSERT_EQ(spCapture->records.size(), 1u);
  EXPECT_EQ(spCapture->records[0].level, pos::logging::Level::ERROR);
}

TEST(LoggerTest, RemoveHandlerStopsDelivery) {
  auto logger = pos::logging::getLogger("remove_test");
  logger.setPropagate(false);
  auto spCapture = std::make_shared<CaptureHandler>();
  logger.addHandler(spCapture);

  logger.info << "one";
  logger.removeHandler(spCapture);
  logger.info << "two";

  EXPECT_EQ(spCapture->records.size(), 1u);
}

TEST(LoggerTest, CopiedLoggerStillLogs) {
  auto original = pos::logging::getLogger("copy_test");
  original.setPropagate(false);
  auto spCapture = std::make_shared<CaptureHandler>();
  original.addHandler(spCapture);

  pos::logging::Logger copy = original;
  copy.info << "through copy";
  pos::logging::Logger assigned = pos::logging::getRootLogger();
  assigned = original;
  assigned.info << "through assignment";

  EXPECT_EQ(spCapture->records.size(), 2u);
}

TEST(LoggerTest, FileHandlerThrowsOnBadPath) {
  auto logger = pos::logging::getLogger("file_test");
  EXPECT_THROW(logger.addFileHandler("/nonexistent-dir/x/y.log"),
               std::runtime_error);
}
