/**
 * @file ConnectionRegistryTest.cpp
 * @brief Unit tests for ConnectionRegistry
 */

#include <gtest/gtest.h>
#include "relay/ConnectionRegistry.h"
#include "mocks/RecordingPeerLink.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace signalrelay::relay;
using signalrelay::tests::RecordingPeerLink;

class ConnectionRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingPeerLink> link_ = std::make_shared<RecordingPeerLink>();
    ConnectionRegistry registry_;
};

TEST_F(ConnectionRegistryTest, NewRegistry_IsEmpty) {
    EXPECT_TRUE(registry_.is_empty());
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_TRUE(registry_.others("anyone").empty());
}

TEST_F(ConnectionRegistryTest, Add_DuplicateId_Throws) {
    registry_.add("peer-1", link_);

    EXPECT_THROW(registry_.add("peer-1", link_), DuplicatePeerId);
    EXPECT_EQ(registry_.size(), 1u);
}

TEST_F(ConnectionRegistryTest, Others_ReturnsRegistrationOrderWithoutExcluded) {
    registry_.add("peer-c", link_);
    registry_.add("peer-a", link_);
    registry_.add("peer-b", link_);

    EXPECT_EQ(registry_.others("peer-a"), (std::vector<std::string>{"peer-c", "peer-b"}));
    EXPECT_EQ(registry_.others("nobody"), (std::vector<std::string>{"peer-c", "peer-a", "peer-b"}));
}

TEST_F(ConnectionRegistryTest, Remove_PresentAndAbsent) {
    registry_.add("peer-1", link_);
    registry_.add("peer-2", link_);

    EXPECT_TRUE(registry_.remove("peer-1"));
    EXPECT_FALSE(registry_.remove("peer-1"));
    EXPECT_FALSE(registry_.contains("peer-1"));
    EXPECT_TRUE(registry_.contains("peer-2"));

    EXPECT_TRUE(registry_.remove("peer-2"));
    EXPECT_TRUE(registry_.is_empty());
}

TEST_F(ConnectionRegistryTest, Add_DoesNotExtendTransportLifetime) {
    {
        auto transient = std::make_shared<RecordingPeerLink>();
        registry_.add("peer-1", transient);
    }

    ASSERT_EQ(registry_.entries().size(), 1u);
    EXPECT_TRUE(registry_.entries().front().link.expired());
}

TEST_F(ConnectionRegistryTest, Find_ReturnsLiveLinkOnly) {
    auto transient = std::make_shared<RecordingPeerLink>();
    registry_.add("peer-1", link_);
    registry_.add("peer-2", transient);

    EXPECT_EQ(registry_.find("peer-1"), link_);
    EXPECT_EQ(registry_.find("peer-3"), nullptr);

    transient.reset();
    EXPECT_EQ(registry_.find("peer-2"), nullptr);
    EXPECT_TRUE(registry_.contains("peer-2"));
}
