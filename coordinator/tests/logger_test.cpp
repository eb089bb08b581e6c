#include <gtest/gtest.h>

#include "logger.hpp"
#include "test_helpers.hpp"

#include <log4cplus/loggingmacros.h>

#include <string>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
    void SetUp() override { init_test_logging(); }
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

} // namespace

TEST(Logger, LoggersShareCoordinatorHierarchy) {
    EXPECT_EQ(core_logger().getName(), LOG4CPLUS_TEXT("coordinator"));
    EXPECT_EQ(client_logger().getName(), LOG4CPLUS_TEXT("coordinator.client"));
    EXPECT_EQ(config_logger().getName(), LOG4CPLUS_TEXT("coordinator.config"));
    EXPECT_EQ(client_logger().getParent().getName(), core_logger().getName());
}

TEST(Logger, DashKeepsConfiguredAppenders) {
    auto before = log4cplus::Logger::getRoot().getAllAppenders().size();

    set_log_file("-");

    EXPECT_EQ(log4cplus::Logger::getRoot().getAllAppenders().size(), before);
}

// Must stay last in this binary: the root logger keeps writing to the file.
TEST(Logger, RelativeLogFileIsPlacedUnderBaseDirectory) {
    TempDir dir;
    auto base = dir.path() / "images";

    set_log_file("client.log", base);
    LOG4CPLUS_INFO(client_logger(), "Connected to server at 127.0.0.1:8080");

    auto contents = read_file(base / "client.log");
    EXPECT_NE(contents.find("INFO - Connected to server at 127.0.0.1:8080"), std::string::npos) << contents;
}
