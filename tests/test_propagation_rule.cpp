#include <gtest/gtest.h>

#include "middleware/middleware_exceptions.hpp"
#include "middleware/propagation_rule.hpp"


TEST(PropagationRule, AllowAllCopiesCustomHeaders)
{
	const auto rule = PropagationRule::allow_all();

	EXPECT_TRUE(rule.is_propagated("www-authenticate"));
	EXPECT_TRUE(rule.is_propagated("X-Custom-Test"));
	EXPECT_NO_THROW(rule.validate());
}

TEST(PropagationRule, ReservedKeysAreNeverPropagated)
{
	const auto rule = PropagationRule::allow_all();

	EXPECT_FALSE(rule.is_propagated("grpc-status"));
	EXPECT_FALSE(rule.is_propagated("grpc-message"));
	EXPECT_FALSE(rule.is_propagated("Grpc-Encoding"));
	EXPECT_FALSE(rule.is_propagated(":status"));
	EXPECT_FALSE(rule.is_propagated("content-type"));
	EXPECT_FALSE(rule.is_propagated("TE"));
	EXPECT_FALSE(rule.is_propagated("transfer-encoding"));
}

TEST(PropagationRule, AllowListIsCaseInsensitive)
{
	const auto rule = PropagationRule::allow_list({"WWW-Authenticate", "x-custom-test"});

	EXPECT_TRUE(rule.is_propagated("www-authenticate"));
	EXPECT_TRUE(rule.is_propagated("X-CUSTOM-TEST"));
	EXPECT_FALSE(rule.is_propagated("x-other"));
}

TEST(PropagationRule, DenyListBlocksListedKeys)
{
	const auto rule = PropagationRule::deny_list({"x-secret"});

	EXPECT_FALSE(rule.is_propagated("X-Secret"));
	EXPECT_TRUE(rule.is_propagated("www-authenticate"));
	EXPECT_FALSE(rule.is_propagated("grpc-status"));
}

TEST(PropagationRule, AllowListingReservedKeyIsRejected)
{
	EXPECT_THROW(PropagationRule::allow_list({"www-authenticate", "grpc-status"}).validate(), ConfigurationError);
	EXPECT_THROW(PropagationRule::allow_list({"Content-Type"}).validate(), ConfigurationError);
	EXPECT_THROW(PropagationRule::allow_list({":authority"}).validate(), ConfigurationError);
}

TEST(PropagationRule, DenyListingReservedKeyIsAccepted)
{
	EXPECT_NO_THROW(PropagationRule::deny_list({"grpc-status"}).validate());
}

TEST(PropagationRule, InvalidKeyIsRejected)
{
	EXPECT_THROW(PropagationRule::allow_list({"x custom"}).validate(), ConfigurationError);
	EXPECT_THROW(PropagationRule::deny_list({""}).validate(), ConfigurationError);
}

TEST(PropagationRule, FromModeIgnoresKeysForAllowAll)
{
	const auto rule = PropagationRule::from_mode(PropagationRule::Mode::ALLOW_ALL, {"x-ignored"});

	EXPECT_EQ(rule.mode(), PropagationRule::Mode::ALLOW_ALL);
	EXPECT_TRUE(rule.keys().empty());
}

TEST(PropagationRule, ValidKeyCharacters)
{
	EXPECT_TRUE(PropagationRule::is_valid_key("x-custom_test.v1"));
	EXPECT_TRUE(PropagationRule::is_valid_key("X-Upper"));
	EXPECT_FALSE(PropagationRule::is_valid_key("x:colon"));
	EXPECT_FALSE(PropagationRule::is_valid_key(""));
}
