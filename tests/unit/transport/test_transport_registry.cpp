/**
 * @file test_transport_registry.cpp
 * @brief Unit tests for transport registration and selection
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/core/logging.h>
#include <kcenon/bulk_transfer/transport/file_share_client.h>
#include <kcenon/bulk_transfer/transport/transport_registry.h>

#include "../fake_transport_client.h"

namespace kcenon::bulk_transfer::test {

class TransportRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { get_logger().set_console_output(false); }
    void TearDown() override { get_logger().set_console_output(true); }

    static auto fake_factory(const std::string& id, bool supported) -> transport_factory {
        return [id, supported](const client_configuration&) {
            auto client = std::make_shared<fake_transport_client>(id);
            client->set_supported(supported, supported ? "" : "not on this host");
            return client;
        };
    }

    transport_registry registry_;
    client_configuration config_;
};

TEST_F(TransportRegistryTest, WithDefaults_ContainsFileShare) {
    auto registry = transport_registry::with_defaults();
    EXPECT_TRUE(registry->contains("file_share"));

    auto created = registry->create("file_share", config_);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created.value()->id(), "file_share");
    EXPECT_TRUE(created.value()->supports_listing());
}

TEST_F(TransportRegistryTest, Register_RejectsDuplicatesAndEmpty) {
    ASSERT_TRUE(registry_.register_factory("a", fake_factory("a", true)).has_value());

    auto duplicate = registry_.register_factory("a", fake_factory("a", true));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, error_code::invalid_state);

    auto empty_id = registry_.register_factory("", fake_factory("x", true));
    ASSERT_FALSE(empty_id.has_value());
    EXPECT_EQ(empty_id.error().code, error_code::invalid_argument);

    EXPECT_FALSE(registry_.register_factory("b", nullptr).has_value());
}

TEST_F(TransportRegistryTest, Ids_AreSorted) {
    ASSERT_TRUE(registry_.register_factory("zeta", fake_factory("zeta", true)).has_value());
    ASSERT_TRUE(registry_.register_factory("alpha", fake_factory("alpha", true)).has_value());
    EXPECT_EQ(registry_.ids(), (std::vector<std::string>{"alpha", "zeta"}));

    EXPECT_TRUE(registry_.unregister("zeta"));
    EXPECT_FALSE(registry_.unregister("zeta"));
    EXPECT_EQ(registry_.ids().size(), 1u);
}

TEST_F(TransportRegistryTest, Create_UnknownIdFails) {
    auto created = registry_.create("missing", config_);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::transport_not_found);
}

TEST_F(TransportRegistryTest, Create_FactoryReturningNothingFails) {
    ASSERT_TRUE(registry_
                    .register_factory("null", [](const client_configuration&)
                                                  -> std::shared_ptr<transport_client> {
                                          return nullptr;
                                      })
                    .has_value());
    auto created = registry_.create("null", config_);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::transport_error);
}

TEST_F(TransportRegistryTest, SelectBest_TakesFirstSupportedInRankOrder) {
    ASSERT_TRUE(registry_.register_factory("fast", fake_factory("fast", false)).has_value());
    ASSERT_TRUE(registry_.register_factory("slow", fake_factory("slow", true)).has_value());
    ASSERT_TRUE(registry_.register_factory("other", fake_factory("other", true)).has_value());

    auto selected = registry_.select_best({"fast", "missing", "slow", "other"}, config_);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected.value()->id(), "slow");
}

TEST_F(TransportRegistryTest, SelectBest_NoSupportedCandidate) {
    ASSERT_TRUE(registry_.register_factory("fast", fake_factory("fast", false)).has_value());

    auto selected = registry_.select_best({"fast", "missing"}, config_);
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(selected.error().code, error_code::transport_not_supported);
    EXPECT_NE(selected.error().message.find("not on this host"), std::string::npos);

    auto none = registry_.select_best({}, config_);
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, error_code::transport_not_supported);
}

TEST_F(TransportRegistryTest, SelectBest_Canceled) {
    ASSERT_TRUE(registry_.register_factory("a", fake_factory("a", true)).has_value());
    cancellation_source source;
    source.cancel();
    auto selected = registry_.select_best({"a"}, config_, source.token());
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(selected.error().code, error_code::operation_canceled);
}

TEST_F(TransportRegistryTest, FactoryReceivesConfiguration) {
    config_.max_path_length = 123;
    auto registry = transport_registry::with_defaults();
    auto created = registry->create("file_share", config_);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created.value()->max_path_length(), 123u);
}

}  // namespace kcenon::bulk_transfer::test
