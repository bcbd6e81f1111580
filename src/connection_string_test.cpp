#include "connection_string.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using blobfs::ConnectionString;

TEST(ConnectionStringTest, ParsesAllKeys) {
    auto connection = ConnectionString::parse(
        "Endpoint=http://localhost:4443/;ProjectId=my-project;CredentialsFile=/etc/blobfs/sa.json");

    EXPECT_EQ(connection.endpoint(), "http://localhost:4443");
    EXPECT_EQ(connection.projectId(), "my-project");
    EXPECT_EQ(connection.credentialsFile(), "/etc/blobfs/sa.json");
    EXPECT_FALSE(connection.anonymous());
}

TEST(ConnectionStringTest, KeysAreCaseInsensitive) {
    auto connection = ConnectionString::parse("endpoint=http://emulator;ANONYMOUS=yes;");

    EXPECT_EQ(connection.endpoint(), "http://emulator");
    EXPECT_TRUE(connection.anonymous());
}

TEST(ConnectionStringTest, MissingKeysKeepDefaults) {
    auto connection = ConnectionString::parse("ProjectId=p");

    EXPECT_TRUE(connection.endpoint().empty());
    EXPECT_TRUE(connection.credentialsFile().empty());
    EXPECT_FALSE(connection.anonymous());
}

TEST(ConnectionStringTest, RejectsMalformedInput) {
    EXPECT_THROW(ConnectionString::parse(""), std::runtime_error);
    EXPECT_THROW(ConnectionString::parse("   "), std::runtime_error);
    EXPECT_THROW(ConnectionString::parse("Endpoint"), std::runtime_error);
    EXPECT_THROW(ConnectionString::parse("=value"), std::runtime_error);
    EXPECT_THROW(ConnectionString::parse("AccountKey=secret"), std::runtime_error);
    EXPECT_THROW(ConnectionString::parse("Anonymous=perhaps"), std::runtime_error);
}

TEST(ConnectionStringTest, CredentialsConflictWithAnonymous) {
    EXPECT_THROW(ConnectionString::parse("CredentialsFile=/k.json;Anonymous=true"), std::runtime_error);
    EXPECT_NO_THROW(ConnectionString::parse("CredentialsFile=/k.json;Anonymous=false"));
}

TEST(ConnectionStringTest, DescribeHidesCredentialsPath) {
    auto connection = ConnectionString::parse("ProjectId=p;CredentialsFile=/secret/key.json");
    std::string description = connection.describe();

    EXPECT_EQ(description.find("/secret/key.json"), std::string::npos);
    EXPECT_NE(description.find("project=p"), std::string::npos);
    EXPECT_NE(description.find("service-account"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
