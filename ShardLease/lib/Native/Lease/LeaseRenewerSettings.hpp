#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "Global/pch.hpp"
#include "Lease/LeaseEnums.hpp"
#include "Lease/Store/RedisLeaseStore.hpp"

struct LeaseRenewerSettings
{
	static inline constexpr std::chrono::milliseconds kDefaultLeaseDuration =
		std::chrono::milliseconds(10000);
	static inline constexpr std::chrono::milliseconds kDefaultRenewalPassTimeout =
		std::chrono::milliseconds(3000);
	static inline constexpr std::chrono::milliseconds kRenewalIntervalEpsilon =
		std::chrono::milliseconds(25);

	std::string workerIdentifier;
	std::chrono::milliseconds leaseDuration = kDefaultLeaseDuration;
	std::chrono::milliseconds renewalPassTimeout = kDefaultRenewalPassTimeout;
	uint32_t maxRenewalThreads = 20;
	uint32_t renewalAttempts = 2;
	TransientFailurePolicy transientFailurePolicy = TransientFailurePolicy::eRetainUntilExpiry;
	bool renewOnInitialize = false;

	// Present only when the settings name a Redis lease table.
	std::optional<RedisLeaseStore::Options> redis;

	// A third of the lease duration, minus a small margin so a pass lands before
	// the store side deadline.
	[[nodiscard]] std::chrono::milliseconds RenewalInterval() const;

	// Throws std::invalid_argument describing the first bad field.
	void Validate() const;

	// Throws std::runtime_error if the file is unreadable or not JSON, and
	// std::invalid_argument if a value is out of range.
	[[nodiscard]] static LeaseRenewerSettings ParseSettingsFile(const std::filesystem::path& file);
	[[nodiscard]] static LeaseRenewerSettings FromJson(const Json& json);
};
