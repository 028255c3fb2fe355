// In-memory lease table with token-conditional writes.

#include "InMemoryLeaseStore.hpp"

#include <thread>

#include "Global/Misc/UUID.hpp"

std::optional<LeaseStoreFailure> InMemoryLeaseStore::BeforeWrite()
{
	++callCount;
	if (const auto latency = writeLatencyMs.load(); latency > 0)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(latency));
	}
	if (unavailable.load())
	{
		return LeaseStoreFailure{"lease store unavailable"};
	}
	int remaining = failNextWrites.load();
	while (remaining > 0)
	{
		if (failNextWrites.compare_exchange_weak(remaining, remaining - 1))
		{
			return LeaseStoreFailure{"injected transient failure"};
		}
	}
	return std::nullopt;
}

void InMemoryLeaseStore::BeforeRead()
{
	++callCount;
	if (unavailable.load())
	{
		throw LeaseStoreException("lease store unavailable");
	}
}

template <class Fn>
LeaseWriteResult InMemoryLeaseStore::ConditionalWrite(std::string_view key,
													  std::string_view expectedToken, Fn&& fn)
{
	if (auto failure = BeforeWrite())
	{
		return *failure;
	}

	std::scoped_lock lock(tableMutex);
	auto it = table.find(key);
	if (it == table.end())
	{
		return LeaseNotFound{};
	}
	Lease& stored = it->second;
	if (stored.concurrencyToken != expectedToken)
	{
		return LeaseTokenMismatch{};
	}
	fn(stored);
	stored.counter += 1;
	stored.concurrencyToken = UUIDGen::GenString();
	return LeaseWriteSuccess{stored.concurrencyToken};
}

LeaseWriteResult InMemoryLeaseStore::RenewLease(const Lease& lease)
{
	return ConditionalWrite(lease.key, lease.concurrencyToken, [](Lease&) {});
}

LeaseWriteResult InMemoryLeaseStore::UpdateLease(const Lease& lease,
												 const std::optional<std::string>& checkpoint,
												 std::string_view expectedToken)
{
	return ConditionalWrite(lease.key, expectedToken,
							[&checkpoint](Lease& stored)
							{
								stored.checkpoint = checkpoint;
								stored.ownerSwitchesSinceCheckpoint = 0;
							});
}

LeaseWriteResult InMemoryLeaseStore::TakeLease(const Lease& lease, std::string_view newOwner)
{
	return ConditionalWrite(lease.key, lease.concurrencyToken,
							[newOwner](Lease& stored)
							{
								if (stored.owner != newOwner)
								{
									stored.ownerSwitchesSinceCheckpoint += 1;
								}
								stored.owner = std::string(newOwner);
							});
}

std::vector<Lease> InMemoryLeaseStore::ListLeasesOwnedBy(std::string_view owner)
{
	BeforeRead();
	std::vector<Lease> out;
	std::scoped_lock lock(tableMutex);
	for (const auto& [key, stored] : table)
	{
		if (stored.owner == owner)
		{
			out.push_back(stored);
		}
	}
	return out;
}

bool InMemoryLeaseStore::CreateLeaseIfNotExists(const Lease& lease)
{
	BeforeRead();
	std::scoped_lock lock(tableMutex);
	if (table.contains(lease.key))
	{
		return false;
	}
	Lease stored = lease;
	stored.concurrencyToken = UUIDGen::GenString();
	stored.lastRenewalLocalTime.reset();
	table.emplace(lease.key, std::move(stored));
	logger.DebugFormatted("Created {}", lease.ToString());
	return true;
}

std::optional<Lease> InMemoryLeaseStore::GetLease(std::string_view key)
{
	BeforeRead();
	std::scoped_lock lock(tableMutex);
	auto it = table.find(key);
	if (it == table.end())
	{
		return std::nullopt;
	}
	return it->second;
}

std::vector<Lease> InMemoryLeaseStore::ListLeases()
{
	BeforeRead();
	std::vector<Lease> out;
	std::scoped_lock lock(tableMutex);
	out.reserve(table.size());
	for (const auto& [key, stored] : table)
	{
		out.push_back(stored);
	}
	return out;
}

bool InMemoryLeaseStore::DeleteLease(std::string_view key)
{
	BeforeRead();
	std::scoped_lock lock(tableMutex);
	auto it = table.find(key);
	if (it == table.end())
	{
		return false;
	}
	table.erase(it);
	return true;
}
