#include "HeldLeaseRegistry.hpp"

HeldLeaseRegistry::HeldLeaseRegistry(std::shared_ptr<Log> inLogger) : logger(std::move(inLogger))
{
}

size_t HeldLeaseRegistry::Add(const std::vector<Lease>& leases, SteadyTimePoint now)
{
	size_t accepted = 0;
	std::scoped_lock lock(registryMutex);
	for (const auto& lease : leases)
	{
		if (!lease.lastRenewalLocalTime.has_value())
		{
			logger->DebugFormatted("Ignoring lease {}: no local renewal time", lease.key);
			continue;
		}
		Lease held = lease;
		held.lastRenewalLocalTime = now;
		heldLeases.insert_or_assign(held.key, std::move(held));
		++accepted;
	}
	return accepted;
}

std::optional<Lease> HeldLeaseRegistry::Get(const std::string& key,
											std::chrono::milliseconds leaseDuration,
											SteadyTimePoint now) const
{
	std::scoped_lock lock(registryMutex);
	auto it = heldLeases.find(key);
	if (it == heldLeases.end() || it->second.IsExpired(leaseDuration, now))
	{
		return std::nullopt;
	}
	return it->second;
}

HeldLeaseRegistry::LeaseMap HeldLeaseRegistry::GetAll(std::chrono::milliseconds leaseDuration,
													  SteadyTimePoint now) const
{
	LeaseMap out;
	std::scoped_lock lock(registryMutex);
	for (const auto& [key, lease] : heldLeases)
	{
		if (!lease.IsExpired(leaseDuration, now))
		{
			out.emplace(key, lease);
		}
	}
	return out;
}

std::optional<Lease> HeldLeaseRegistry::Find(const std::string& key) const
{
	std::scoped_lock lock(registryMutex);
	auto it = heldLeases.find(key);
	if (it == heldLeases.end())
	{
		return std::nullopt;
	}
	return it->second;
}

std::vector<Lease> HeldLeaseRegistry::Snapshot() const
{
	std::vector<Lease> out;
	std::scoped_lock lock(registryMutex);
	out.reserve(heldLeases.size());
	for (const auto& [key, lease] : heldLeases)
	{
		out.push_back(lease);
	}
	return out;
}

size_t HeldLeaseRegistry::Size() const
{
	std::scoped_lock lock(registryMutex);
	return heldLeases.size();
}

void HeldLeaseRegistry::Clear()
{
	std::scoped_lock lock(registryMutex);
	heldLeases.clear();
	std::erase_if(writeGates, [](const auto& entry) { return entry.second.use_count() == 1; });
}

bool HeldLeaseRegistry::Remove(const std::string& key)
{
	std::scoped_lock lock(registryMutex);
	const bool removed = heldLeases.erase(key) > 0;
	PruneWriteGateLocked(key);
	return removed;
}

bool HeldLeaseRegistry::RemoveIfToken(const std::string& key, const std::string& token)
{
	std::scoped_lock lock(registryMutex);
	auto it = heldLeases.find(key);
	if (it == heldLeases.end() || it->second.concurrencyToken != token)
	{
		return false;
	}
	heldLeases.erase(it);
	PruneWriteGateLocked(key);
	return true;
}

bool HeldLeaseRegistry::ApplyIfToken(const std::string& key, const std::string& token,
									 const Mutation& mutation)
{
	std::scoped_lock lock(registryMutex);
	auto it = heldLeases.find(key);
	if (it == heldLeases.end() || it->second.concurrencyToken != token)
	{
		return false;
	}
	// Mutate a copy so a throwing mutation leaves the entry intact.
	Lease updated = it->second;
	mutation(updated);
	it->second = std::move(updated);
	return true;
}

std::shared_ptr<std::mutex> HeldLeaseRegistry::WriteGate(const std::string& key)
{
	std::scoped_lock lock(registryMutex);
	auto& gate = writeGates[key];
	if (!gate)
	{
		gate = std::make_shared<std::mutex>();
	}
	return gate;
}

size_t HeldLeaseRegistry::PruneWriteGates()
{
	std::scoped_lock lock(registryMutex);
	return std::erase_if(writeGates,
						 [this](const auto& entry)
						 {
							 return entry.second.use_count() == 1 &&
									!heldLeases.contains(entry.first);
						 });
}

size_t HeldLeaseRegistry::WriteGateCount() const
{
	std::scoped_lock lock(registryMutex);
	return writeGates.size();
}

void HeldLeaseRegistry::PruneWriteGateLocked(const std::string& key)
{
	auto it = writeGates.find(key);
	if (it != writeGates.end() && it->second.use_count() == 1 && !heldLeases.contains(key))
	{
		writeGates.erase(it);
	}
}
