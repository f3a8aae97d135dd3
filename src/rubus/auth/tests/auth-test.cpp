// GTest
#include <gtest/gtest.h>

// boost
#include <boost/uuid/string_generator.hpp>

// rubus
#include <rubus/auth/default-authenticator.hpp>

using namespace rubus;


TEST(AuthTest, EveryConnectionGetsFreshViewer) {
    DefaultAuthenticator authenticator;

    auto first = authenticator.authenticate("127.0.0.1:40000");
    auto second = authenticator.authenticate("127.0.0.1:40000");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    EXPECT_NE(first->id, second->id);
    EXPECT_EQ(first->id, first->name);
    EXPECT_FALSE(first->admin);
    EXPECT_NO_THROW(boost::uuids::string_generator()(first->id));
}

TEST(AuthTest, ModifyingRequiresAdmin) {
    BasicViewerAuthorizer authorizer;
    Viewer viewer {.id = "v", .name = "v", .admin = false};
    Viewer admin {.id = "a", .name = "a", .admin = true};

    EXPECT_TRUE(authorizer.authorize(viewer, EAction::READ));
    EXPECT_FALSE(authorizer.authorize(viewer, EAction::MODIFY));
    EXPECT_TRUE(authorizer.authorize(admin, EAction::READ));
    EXPECT_TRUE(authorizer.authorize(admin, EAction::MODIFY));
}
