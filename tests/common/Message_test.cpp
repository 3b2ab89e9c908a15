#include <gtest/gtest.h>
#include "common/Message.hpp"
#include "common/Util.hpp"
#include <regex>
#include <set>

using namespace mcpgate;

TEST(MessageTest, ClassifiesRequest) {
    EXPECT_EQ(classify_frame(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})", Direction::ClientToServer),
              MessageType::Request);
}

TEST(MessageTest, ClassifiesNotification) {
    EXPECT_EQ(classify_frame(R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                             Direction::ClientToServer),
              MessageType::Notification);
}

TEST(MessageTest, ClassifiesResponse) {
    EXPECT_EQ(classify_frame(R"({"jsonrpc":"2.0","id":1,"result":{}})", Direction::ServerToClient),
              MessageType::Response);
    EXPECT_EQ(classify_frame(R"({"jsonrpc":"2.0","id":1,"error":{"code":-1}})", Direction::ServerToClient),
              MessageType::Response);
}

TEST(MessageTest, UnparseableFrameFallsBackToDirection) {
    EXPECT_EQ(classify_frame("not json", Direction::ClientToServer), MessageType::Request);
    EXPECT_EQ(classify_frame("not json", Direction::ServerToClient), MessageType::Response);
}

TEST(MessageTest, EnumNames) {
    EXPECT_EQ(to_string(Direction::ClientToServer), "client_to_server");
    EXPECT_EQ(to_string(Direction::ServerToClient), "server_to_client");
    EXPECT_EQ(to_string(MessageType::Notification), "notification");
    EXPECT_EQ(to_string(Transport::Stdio), "stdio");
    EXPECT_EQ(to_string(Transport::Http), "http");
}

TEST(UtilTest, TimestampIsRfc3339Utc) {
    std::regex pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    EXPECT_TRUE(std::regex_match(rfc3339_now(), pattern));
}

TEST(UtilTest, GeneratedIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(make_id("stdio_echo"));
    }
    EXPECT_EQ(ids.size(), 100);
    EXPECT_EQ(make_id("stdio_echo").rfind("stdio_echo_", 0), 0);
}

TEST(UtilTest, UrlSafeNames) {
    EXPECT_TRUE(is_url_safe("my-server_1"));
    EXPECT_FALSE(is_url_safe(""));
    EXPECT_FALSE(is_url_safe("has space"));
    EXPECT_FALSE(is_url_safe("slash/name"));
}
