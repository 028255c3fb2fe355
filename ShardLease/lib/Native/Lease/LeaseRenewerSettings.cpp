#include "LeaseRenewerSettings.hpp"

#include <boost/describe/enum_from_string.hpp>

#include <algorithm>
#include <fstream>
#include <limits>
#include <stdexcept>

std::chrono::milliseconds LeaseRenewerSettings::RenewalInterval() const
{
	const auto interval = leaseDuration / 3 - kRenewalIntervalEpsilon;
	return std::max(interval, std::chrono::milliseconds(1));
}

void LeaseRenewerSettings::Validate() const
{
	if (workerIdentifier.empty())
	{
		throw std::invalid_argument("WorkerIdentifier must not be empty");
	}
	if (leaseDuration <= std::chrono::milliseconds::zero())
	{
		throw std::invalid_argument("LeaseDurationMs must be positive");
	}
	if (renewalPassTimeout <= std::chrono::milliseconds::zero() ||
		renewalPassTimeout > leaseDuration)
	{
		throw std::invalid_argument(
			std::format("RenewalPassTimeoutMs must be in (0, {}]", leaseDuration.count()));
	}
	if (maxRenewalThreads == 0)
	{
		throw std::invalid_argument("MaxRenewalThreads must be at least 1");
	}
	if (renewalAttempts == 0)
	{
		throw std::invalid_argument("RenewalAttempts must be at least 1");
	}
}

LeaseRenewerSettings LeaseRenewerSettings::ParseSettingsFile(const std::filesystem::path& file)
{
	std::ifstream settingsFile(file);
	if (!settingsFile.is_open())
	{
		throw std::runtime_error(std::format("Unable to open settings file {}", file.string()));
	}

	std::string contents((std::istreambuf_iterator<char>(settingsFile)),
						 std::istreambuf_iterator<char>());
	const Json parsed = Json::parse(contents, nullptr, false);
	if (parsed.is_discarded())
	{
		throw std::runtime_error(std::format("Failed to parse settings file {}", file.string()));
	}
	return FromJson(parsed);
}

LeaseRenewerSettings LeaseRenewerSettings::FromJson(const Json& json)
{
	auto IsEntryValid = [](const Json& j, const std::string& str)
	{ return j.is_object() && j.contains(str) && !j[str].is_null(); };
	// Read signed so a negative value is rejected instead of wrapping.
	auto ReadCount = [](const Json& j, const std::string& str, int64_t minimum) -> uint32_t
	{
		const int64_t value = j[str].get<int64_t>();
		if (value < minimum || value > std::numeric_limits<uint32_t>::max())
		{
			throw std::invalid_argument(std::format("{} must be in [{}, {}], got {}", str, minimum,
													std::numeric_limits<uint32_t>::max(), value));
		}
		return static_cast<uint32_t>(value);
	};

	LeaseRenewerSettings settings;
	try
	{
		if (IsEntryValid(json, "WorkerIdentifier"))
		{
			settings.workerIdentifier = json["WorkerIdentifier"].get<std::string>();
		}
		if (IsEntryValid(json, "LeaseDurationMs"))
		{
			settings.leaseDuration = std::chrono::milliseconds(json["LeaseDurationMs"].get<int64_t>());
		}
		if (IsEntryValid(json, "RenewalPassTimeoutMs"))
		{
			settings.renewalPassTimeout =
				std::chrono::milliseconds(json["RenewalPassTimeoutMs"].get<int64_t>());
		}
		if (IsEntryValid(json, "MaxRenewalThreads"))
		{
			settings.maxRenewalThreads = ReadCount(json, "MaxRenewalThreads", 1);
		}
		if (IsEntryValid(json, "RenewalAttempts"))
		{
			settings.renewalAttempts = ReadCount(json, "RenewalAttempts", 1);
		}
		if (IsEntryValid(json, "TransientFailurePolicy"))
		{
			const std::string name = json["TransientFailurePolicy"].get<std::string>();
			if (!boost::describe::enum_from_string(name.c_str(), settings.transientFailurePolicy))
			{
				throw std::invalid_argument(
					std::format("Unknown TransientFailurePolicy '{}'", name));
			}
		}
		if (IsEntryValid(json, "RenewOnInitialize"))
		{
			settings.renewOnInitialize = json["RenewOnInitialize"].get<bool>();
		}
		if (IsEntryValid(json, "Redis"))
		{
			const Json& redisJ = json["Redis"];
			RedisLeaseStore::Options redisOptions;
			if (IsEntryValid(redisJ, "Host"))
				redisOptions.endpoint.host = redisJ["Host"].get<std::string>();
			if (IsEntryValid(redisJ, "Port"))
				redisOptions.endpoint.port = redisJ["Port"].get<int32_t>();
			if (IsEntryValid(redisJ, "Cluster"))
				redisOptions.endpoint.IsCluster = redisJ["Cluster"].get<bool>();
			if (IsEntryValid(redisJ, "KeyPrefix"))
				redisOptions.keyPrefix = redisJ["KeyPrefix"].get<std::string>();
			if (IsEntryValid(redisJ, "ConnectRetries"))
				redisOptions.connectRetries = ReadCount(redisJ, "ConnectRetries", 0);
			if (IsEntryValid(redisJ, "ConnectRetryIntervalMs"))
				redisOptions.connectRetryIntervalMs = ReadCount(redisJ, "ConnectRetryIntervalMs", 0);
			settings.redis = std::move(redisOptions);
		}
	}
	catch (const Json::type_error& e)
	{
		throw std::invalid_argument(std::format("Mistyped lease renewer setting: {}", e.what()));
	}

	settings.Validate();
	return settings;
}
