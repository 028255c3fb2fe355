#pragma once
#include <memory>
#include <string>

#include "Database/Redis/Redis.hpp"
#include "Debug/Log.hpp"
#include "ILeaseStore.hpp"

class RedisConnection;

// Lease table kept in Redis. Each lease is one JSON document under
// <keyPrefix><leaseKey>; <keyPrefix>__index is a set of all lease keys.
// Conditional writes run server side as Lua so compare and write are atomic.
class RedisLeaseStore : public ILeaseStore
{
   public:
	struct Options
	{
		Redis::Options endpoint;
		std::string keyPrefix = "ShardLease:";
		uint32_t connectRetries = 20;
		uint32_t connectRetryIntervalMs = 500;
	};

	// Throws sw::redis::Error if the endpoint cannot be reached after retries.
	[[nodiscard]] static std::shared_ptr<RedisLeaseStore> Connect(const Options& options);

	RedisLeaseStore(std::shared_ptr<RedisConnection> inConnection, Options inOptions);

	LeaseWriteResult RenewLease(const Lease& lease) override;
	LeaseWriteResult UpdateLease(const Lease& lease, const std::optional<std::string>& checkpoint,
								 std::string_view expectedToken) override;
	std::vector<Lease> ListLeasesOwnedBy(std::string_view owner) override;

	bool CreateLeaseIfNotExists(const Lease& lease) override;
	std::optional<Lease> GetLease(std::string_view key) override;
	std::vector<Lease> ListLeases() override;
	LeaseWriteResult TakeLease(const Lease& lease, std::string_view newOwner) override;
	bool DeleteLease(std::string_view key) override;

	[[nodiscard]] const Options& GetOptions() const { return options; }

   private:
	[[nodiscard]] std::string BuildLeaseKey(std::string_view leaseKey) const;
	[[nodiscard]] std::string BuildIndexKey() const;

	LeaseWriteResult RunConditionalWrite(std::string_view script, std::string_view leaseKey,
										 std::string_view expectedToken,
										 std::optional<std::string_view> argument);

	std::shared_ptr<RedisConnection> connection;
	Options options;
	Log logger = Log("RedisLeaseStore");
};
