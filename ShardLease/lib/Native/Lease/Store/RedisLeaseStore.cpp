// Redis lease table.
// Scripts reply "OK", "MISMATCH" or "NOTFOUND"; anything else is a store failure.

#include "RedisLeaseStore.hpp"

#include <sw/redis++/errors.h>

#include "Database/Redis/RedisConnection.hpp"
#include "Global/Misc/UUID.hpp"

namespace
{
// KEYS[1] lease document, ARGV[1] expected token, ARGV[2] new token.
constexpr std::string_view kRenewScript = R"lua(
local raw = redis.call('GET', KEYS[1])
if not raw then return 'NOTFOUND' end
local lease = cjson.decode(raw)
if lease['concurrencyToken'] ~= ARGV[1] then return 'MISMATCH' end
lease['leaseCounter'] = lease['leaseCounter'] + 1
lease['concurrencyToken'] = ARGV[2]
redis.call('SET', KEYS[1], cjson.encode(lease))
return 'OK'
)lua";

// ARGV[3] checkpoint, ARGV[4] "1" when the checkpoint is present.
constexpr std::string_view kUpdateScript = R"lua(
local raw = redis.call('GET', KEYS[1])
if not raw then return 'NOTFOUND' end
local lease = cjson.decode(raw)
if lease['concurrencyToken'] ~= ARGV[1] then return 'MISMATCH' end
lease['leaseCounter'] = lease['leaseCounter'] + 1
lease['concurrencyToken'] = ARGV[2]
if ARGV[4] == '1' then lease['checkpoint'] = ARGV[3] else lease['checkpoint'] = cjson.null end
lease['ownerSwitchesSinceCheckpoint'] = 0
redis.call('SET', KEYS[1], cjson.encode(lease))
return 'OK'
)lua";

// ARGV[3] new owner.
constexpr std::string_view kTakeScript = R"lua(
local raw = redis.call('GET', KEYS[1])
if not raw then return 'NOTFOUND' end
local lease = cjson.decode(raw)
if lease['concurrencyToken'] ~= ARGV[1] then return 'MISMATCH' end
lease['leaseCounter'] = lease['leaseCounter'] + 1
lease['concurrencyToken'] = ARGV[2]
if lease['leaseOwner'] ~= ARGV[3] then
  lease['ownerSwitchesSinceCheckpoint'] = lease['ownerSwitchesSinceCheckpoint'] + 1
end
lease['leaseOwner'] = ARGV[3]
redis.call('SET', KEYS[1], cjson.encode(lease))
return 'OK'
)lua";
}  // namespace

std::shared_ptr<RedisLeaseStore> RedisLeaseStore::Connect(const Options& options)
{
	auto connection =
		Redis::Get().Connect(options.endpoint, options.connectRetries, options.connectRetryIntervalMs);
	return std::make_shared<RedisLeaseStore>(std::move(connection), options);
}

RedisLeaseStore::RedisLeaseStore(std::shared_ptr<RedisConnection> inConnection, Options inOptions)
	: connection(std::move(inConnection)), options(std::move(inOptions))
{
}

std::string RedisLeaseStore::BuildLeaseKey(std::string_view leaseKey) const
{
	return options.keyPrefix + std::string(leaseKey);
}

std::string RedisLeaseStore::BuildIndexKey() const
{
	return options.keyPrefix + "__index";
}

LeaseWriteResult RedisLeaseStore::RunConditionalWrite(std::string_view script,
													  std::string_view leaseKey,
													  std::string_view expectedToken,
													  std::optional<std::string_view> argument)
{
	const std::string redisKey = BuildLeaseKey(leaseKey);
	const std::string newToken = UUIDGen::GenString();
	try
	{
		const std::string reply = connection->EvalString(
			script, {redisKey}, {expectedToken, newToken, argument.value_or(""), argument.has_value() ? "1" : "0"});
		if (reply == "OK")
		{
			return LeaseWriteSuccess{newToken};
		}
		if (reply == "MISMATCH")
		{
			return LeaseTokenMismatch{};
		}
		if (reply == "NOTFOUND")
		{
			return LeaseNotFound{};
		}
		logger.ErrorFormatted("Unexpected script reply '{}' for lease {}", reply, leaseKey);
		return LeaseStoreFailure{std::format("unexpected script reply '{}'", reply)};
	}
	catch (const sw::redis::Error& e)
	{
		logger.WarningFormatted("Conditional write on lease {} failed: {}", leaseKey, e.what());
		return LeaseStoreFailure{e.what()};
	}
}

LeaseWriteResult RedisLeaseStore::RenewLease(const Lease& lease)
{
	return RunConditionalWrite(kRenewScript, lease.key, lease.concurrencyToken, std::nullopt);
}

LeaseWriteResult RedisLeaseStore::UpdateLease(const Lease& lease,
											  const std::optional<std::string>& checkpoint,
											  std::string_view expectedToken)
{
	return RunConditionalWrite(kUpdateScript, lease.key, expectedToken,
							   checkpoint.has_value()
								   ? std::optional<std::string_view>(*checkpoint)
								   : std::nullopt);
}

LeaseWriteResult RedisLeaseStore::TakeLease(const Lease& lease, std::string_view newOwner)
{
	return RunConditionalWrite(kTakeScript, lease.key, lease.concurrencyToken, newOwner);
}

bool RedisLeaseStore::CreateLeaseIfNotExists(const Lease& lease)
{
	Lease stored = lease;
	stored.concurrencyToken = UUIDGen::GenString();
	try
	{
		if (!connection->SetIfAbsent(BuildLeaseKey(lease.key), stored.ToJson().dump()))
		{
			return false;
		}
		const long long added = connection->SAdd(BuildIndexKey(), lease.key);
		if (added == 0)
		{
			logger.WarningFormatted("Lease {} was already indexed", lease.key);
		}
		return true;
	}
	catch (const sw::redis::Error& e)
	{
		throw LeaseStoreException(std::format("create lease {}: {}", lease.key, e.what()));
	}
}

std::optional<Lease> RedisLeaseStore::GetLease(std::string_view key)
{
	std::optional<std::string> raw;
	try
	{
		raw = connection->Get(BuildLeaseKey(key));
	}
	catch (const sw::redis::Error& e)
	{
		throw LeaseStoreException(std::format("get lease {}: {}", key, e.what()));
	}
	if (!raw.has_value())
	{
		return std::nullopt;
	}

	const Json parsed = Json::parse(*raw, nullptr, false);
	if (parsed.is_discarded())
	{
		throw LeaseStoreException(std::format("lease {} holds malformed JSON", key));
	}
	try
	{
		return Lease::FromJson(parsed);
	}
	catch (const Json::exception& e)
	{
		throw LeaseStoreException(std::format("lease {} is missing fields: {}", key, e.what()));
	}
}

std::vector<Lease> RedisLeaseStore::ListLeases()
{
	std::vector<std::string> keys;
	try
	{
		keys = connection->SMembers(BuildIndexKey());
	}
	catch (const sw::redis::Error& e)
	{
		throw LeaseStoreException(std::format("list leases: {}", e.what()));
	}

	std::vector<Lease> out;
	out.reserve(keys.size());
	for (const auto& key : keys)
	{
		// Deleted between SMEMBERS and GET.
		if (auto lease = GetLease(key))
		{
			out.push_back(std::move(*lease));
		}
	}
	return out;
}

std::vector<Lease> RedisLeaseStore::ListLeasesOwnedBy(std::string_view owner)
{
	std::vector<Lease> out;
	for (auto& lease : ListLeases())
	{
		if (lease.owner == owner)
		{
			out.push_back(std::move(lease));
		}
	}
	return out;
}

bool RedisLeaseStore::DeleteLease(std::string_view key)
{
	try
	{
		const long long removed = connection->DelKey(BuildLeaseKey(key));
		const long long unindexed = connection->SRem(BuildIndexKey(), key);
		if (removed != unindexed)
		{
			logger.WarningFormatted("Lease {} index out of sync (del={}, srem={})", key, removed,
									unindexed);
		}
		return removed > 0;
	}
	catch (const sw::redis::Error& e)
	{
		throw LeaseStoreException(std::format("delete lease {}: {}", key, e.what()));
	}
}
