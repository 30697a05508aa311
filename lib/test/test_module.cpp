#include "Module.h"
#include <gtest/gtest.h>

// Test Module base class functionality
class TestModule : public pos::Module {
public:
  explicit TestModule(const std::string &name) : pos::Module(name) {}
};

TEST(ModuleTest, LogReturnsLoggerReference) {
  TestModule module("test_module");

  EXPECT_NO_THROW({
    module.log().info << "Test message";
    module.log().debug << "Debug message";
    module.log().warning << "Warning message";
  });

  EXPECT_EQ(module.log().getName(), "test_module");
}

TEST(ModuleTest, LogIsConst) {
  const TestModule module("const_test");

  EXPECT_NO_THROW({ module.log().info << "Const test message"; });
  EXPECT_EQ(module.log().getName(), "const_test");
}

TEST(ModuleTest, DefaultModuleUsesRootLogger) {
  TestModule module("");
  EXPECT_EQ(module.log(), pos::logging::getRootLogger());
}

TEST(ModuleTest, LoggerRedirect) {
  TestModule module("redirect_test");

  module.redirectLogger("owner.component");
  EXPECT_EQ(module.log().getFullName(), "owner.component");
  EXPECT_EQ(module.log(), pos::logging::getLogger("owner.component"));

  EXPECT_NO_THROW(module.log().info << "Message via redirect");
}
