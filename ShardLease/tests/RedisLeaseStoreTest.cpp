#include <gtest/gtest.h>

#include <cstdlib>

#include "Global/Misc/UUID.hpp"
#include "Lease/Store/RedisLeaseStore.hpp"
#include "LeaseTestHarness.hpp"

// Runs against a live server named by SHARDLEASE_TEST_REDIS_HOST[:port].
namespace
{
class RedisLeaseStoreTest : public ::testing::Test
{
   protected:
	void SetUp() override
	{
		const char* host = std::getenv("SHARDLEASE_TEST_REDIS_HOST");
		if (host == nullptr || *host == '\0')
		{
			GTEST_SKIP() << "SHARDLEASE_TEST_REDIS_HOST not set";
		}
		RedisLeaseStore::Options options;
		std::string endpoint = host;
		if (const auto colon = endpoint.find(':'); colon != std::string::npos)
		{
			options.endpoint.port = std::stoi(endpoint.substr(colon + 1));
			endpoint.resize(colon);
		}
		options.endpoint.host = endpoint;
		options.connectRetries = 2;
		options.connectRetryIntervalMs = 100;
		// Fresh namespace per test so runs never see each other's leases.
		options.keyPrefix = "ShardLeaseTest:" + UUIDGen::GenString() + ":";
		store = RedisLeaseStore::Connect(options);
	}

	void TearDown() override
	{
		if (!store)
			return;
		for (const auto& lease : store->ListLeases())
		{
			store->DeleteLease(lease.key);
		}
	}

	Lease Create(const std::string& key, const std::string& owner)
	{
		EXPECT_TRUE(store->CreateLeaseIfNotExists(Lease(key, owner)));
		return *store->GetLease(key);
	}

	std::shared_ptr<RedisLeaseStore> store;
};
}  // namespace

TEST_F(RedisLeaseStoreTest, ConditionalWrites)
{
	Lease lease = Create("1", "foo");
	EXPECT_FALSE(store->CreateLeaseIfNotExists(Lease("1", "bar")));

	const LeaseWriteResult renewed = store->RenewLease(lease);
	ASSERT_TRUE(IsWriteSuccess(renewed));
	EXPECT_TRUE(std::holds_alternative<LeaseTokenMismatch>(store->RenewLease(lease)));

	lease = *store->GetLease("1");
	EXPECT_EQ(lease.counter, 1);
	EXPECT_EQ(lease.concurrencyToken, std::get<LeaseWriteSuccess>(renewed).newToken);

	ASSERT_TRUE(IsWriteSuccess(store->TakeLease(lease, "bar")));
	lease = *store->GetLease("1");
	EXPECT_EQ(lease.owner, "bar");
	EXPECT_EQ(lease.ownerSwitchesSinceCheckpoint, 1);

	ASSERT_TRUE(IsWriteSuccess(store->UpdateLease(lease, "seq-3", lease.concurrencyToken)));
	lease = *store->GetLease("1");
	EXPECT_EQ(lease.checkpoint, "seq-3");
	EXPECT_EQ(lease.ownerSwitchesSinceCheckpoint, 0);
	EXPECT_EQ(lease.counter, 3);

	EXPECT_TRUE(store->DeleteLease("1"));
	EXPECT_TRUE(std::holds_alternative<LeaseNotFound>(store->RenewLease(lease)));
}

TEST_F(RedisLeaseStoreTest, ListLeasesOwnedBy)
{
	Create("1", "foo");
	Create("2", "bar");
	Create("3", "foo");
	EXPECT_EQ(store->ListLeasesOwnedBy("foo").size(), 2u);
	EXPECT_EQ(store->ListLeases().size(), 3u);
}

TEST_F(RedisLeaseStoreTest, RenewerAgainstRedis)
{
	Create("1", "foo");
	Create("2", "foo");
	LeaseRenewer renewer(store, MakeSettings("foo", std::chrono::milliseconds(5000)));
	renewer.Initialize();
	ASSERT_EQ(renewer.GetCurrentlyHeldLeases().size(), 2u);

	const RenewalPassReport report = renewer.RenewLeases();
	EXPECT_EQ(report.renewed, 2u);
	EXPECT_EQ(store->GetLease("1")->concurrencyToken,
			  renewer.GetCurrentlyHeldLease("1")->concurrencyToken);
}
