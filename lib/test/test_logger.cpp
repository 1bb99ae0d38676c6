#include "Logger.h"
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace {

class CaptureHandler : public mc::logging::Handler {
public:
  void emit(mc::logging::Level level, const std::string &loggerName,
            const std::string &message) override {
    if (level < level_) {
      return;
    }
    names.push_back(loggerName);
    messages.push_back(message);
  }

  std::vector<std::string> names;
  std::vector<std::string> messages;
};

// Counts how often it gets formatted
struct CountedValue {
  int *formatted;
};

std::ostream &operator<<(std::ostream &os, const CountedValue &value) {
  ++*value.formatted;
  return os << "value";
}

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
  auto rootLogger = mc::logging::getRootLogger();
  EXPECT_NO_THROW({
    rootLogger.debug << "Debug message";
    rootLogger.info << "Info message";
    rootLogger.warning << "Warning message";
  });
}

TEST(LoggerTest, StreamedValuesAreFormatted) {
  auto logger = mc::logging::getLogger("format_test");
  logger.setPropagate(false);
  auto capture = std::make_shared<CaptureHandler>();
  logger.addHandler(capture);

  logger.info << "height=" << 3 << " ok=" << true;

  ASSERT_EQ(capture->messages.size(), 1u);
  const auto &line = capture->messages[0];
  EXPECT_NE(line.find("[INFO]"), std::string::npos);
  EXPECT_NE(line.find("[format_test]"), std::string::npos);
  EXPECT_NE(line.find("height=3 ok=1"), std::string::npos);
}

TEST(LoggerTest, LoggingLevelFiltersMessages) {
  auto logger = mc::logging::getLogger("level_test");
  logger.setPropagate(false);
  auto capture = std::make_shared<CaptureHandler>();
  logger.addHandler(capture);
  logger.setLevel(mc::logging::Level::WARNING);

  EXPECT_EQ(logger.getLevel(), mc::logging::Level::WARNING);
  logger.debug << "dropped";
  logger.info << "dropped";
  logger.warning << "kept";
  logger.error << "kept";

  EXPECT_EQ(capture->messages.size(), 2u);
}

TEST(LoggerTest, DisabledLevelSkipsFormatting) {
  auto logger = mc::logging::getLogger("lazy_test");
  logger.setPropagate(false);
  logger.setLevel(mc::logging::Level::WARNING);
  EXPECT_FALSE(logger.isEnabledFor(mc::logging::Level::DEBUG));
  EXPECT_TRUE(logger.isEnabledFor(mc::logging::Level::ERROR));

  int formatted = 0;
  logger.debug << CountedValue{ &formatted };
  EXPECT_EQ(formatted, 0);
  logger.error << CountedValue{ &formatted };
  EXPECT_EQ(formatted, 1);
}

TEST(LoggerTest, CopiedLoggerWritesThroughSameNode) {
  auto original = mc::logging::getLogger("copy_test");
  original.setPropagate(false);
  auto capture = std::make_shared<CaptureHandler>();
  original.addHandler(capture);

  mc::logging::Logger copy = original;
  copy.info << "from copy";
  EXPECT_EQ(copy, original);
  EXPECT_EQ(capture->messages.size(), 1u);
}

TEST(LoggerTest, PropagatesToParentWithOriginName) {
  auto parent = mc::logging::getLogger("prop");
  auto child = mc::logging::getLogger("prop.child");
  parent.setPropagate(false);
  auto capture = std::make_shared<CaptureHandler>();
  parent.addHandler(capture);

  child.info << "from child";
  ASSERT_EQ(capture->names.size(), 1u);
  EXPECT_EQ(capture->names[0], "prop.child");

  child.setPropagate(false);
  child.info << "not propagated";
  EXPECT_EQ(capture->names.size(), 1u);
}

TEST(LoggerTest, HierarchicalLoggerCreatesTree) {
  auto moduleA = mc::logging::getLogger("moduleA");
  auto service1 = mc::logging::getLogger("moduleA.service1");
  auto service2 = mc::logging::getLogger("moduleA.service2");

  auto root = mc::logging::getRootLogger();
  EXPECT_EQ(moduleA.getParent(), root);
  EXPECT_EQ(service1.getParent(), moduleA);
  EXPECT_EQ(service2.getParent(), moduleA);
  EXPECT_EQ(moduleA.getChildren().size(), 2u);
  EXPECT_EQ(service1.getFullName(), "moduleA.service1");
}

TEST(LoggerTest, NestedNameCreatesMissingAncestors) {
  auto leaf = mc::logging::getLogger("outer.middle.leaf");

  auto middle = mc::logging::getLogger("outer.middle");
  auto outer = mc::logging::getLogger("outer");
  EXPECT_EQ(leaf.getParent(), middle);
  EXPECT_EQ(middle.getParent(), outer);
  EXPECT_EQ(outer.getParent(), mc::logging::getRootLogger());
  EXPECT_EQ(leaf.getName(), "leaf");
  EXPECT_EQ(leaf.getFullName(), "outer.middle.leaf");
}

TEST(LoggerTest, RedirectMovesLoggerAndChildren) {
  auto app = mc::logging::getLogger("app");
  auto backend = mc::logging::getLogger("app.backend");
  auto db = mc::logging::getLogger("app.backend.db");
  auto system = mc::logging::getLogger("system");

  backend.redirectTo("system");

  EXPECT_EQ(backend.getParent(), system);
  EXPECT_EQ(db.getParent(), backend);
  EXPECT_EQ(db.getFullName(), "system.backend.db");
  EXPECT_TRUE(app.getChildren().empty());
  EXPECT_EQ(system.getChildren().size(), 1u);
}

TEST(LoggerTest, PreventCircularRedirection) {
  auto loggerA = mc::logging::getLogger("loggerA");
  mc::logging::getLogger("loggerB");
  mc::logging::getLogger("loggerC");

  loggerA.redirectTo("loggerB");
  auto loggerB = mc::logging::getLogger("loggerB");
  loggerB.redirectTo("loggerC");

  auto loggerC = mc::logging::getLogger("loggerC");
  EXPECT_THROW(loggerC.redirectTo("loggerB"), std::invalid_argument);
  EXPECT_THROW(loggerC.redirectTo("loggerC"), std::invalid_argument);
}

TEST(LoggerTest, FileHandlerWritesLines) {
  auto fileLogger = mc::logging::getLogger("file_test");
  fileLogger.setPropagate(false);
  EXPECT_NO_THROW(fileLogger.addFileHandler("logger_test.log",
                                            mc::logging::Level::DEBUG));
  EXPECT_NO_THROW(fileLogger.info << "Info message");
}
