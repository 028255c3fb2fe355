#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "Global/pch.hpp"

// Ownership state of one shard. Plain value type: copies are deep and never
// share state with the registry they came from.
class Lease
{
   public:
	std::string key;
	std::string owner;
	int64_t counter = 0;
	std::string concurrencyToken;

	// Local monotonic stamp of the last store-confirmed renewal or update.
	// Never persisted; a lease without one has no freshness basis.
	std::optional<SteadyTimePoint> lastRenewalLocalTime;

	std::optional<std::string> checkpoint;
	int64_t ownerSwitchesSinceCheckpoint = 0;

	Lease() = default;
	Lease(std::string inKey, std::string inOwner) : key(std::move(inKey)), owner(std::move(inOwner))
	{
	}

	[[nodiscard]] bool IsExpired(std::chrono::milliseconds leaseDuration, SteadyTimePoint now) const;

	[[nodiscard]] Json ToJson() const;
	// Throws nlohmann::json::exception on missing or mistyped fields.
	[[nodiscard]] static Lease FromJson(const Json& json);

	[[nodiscard]] std::string ToString() const;

	// Persisted ownership state only; token and local stamp are ignored.
	bool operator==(const Lease& other) const;
};
