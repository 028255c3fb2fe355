#include "Lease.hpp"

bool Lease::IsExpired(std::chrono::milliseconds leaseDuration, SteadyTimePoint now) const
{
	if (!lastRenewalLocalTime.has_value())
	{
		return true;
	}
	return now - *lastRenewalLocalTime >= leaseDuration;
}

Json Lease::ToJson() const
{
	Json json;
	json["leaseKey"] = key;
	json["leaseOwner"] = owner;
	json["leaseCounter"] = counter;
	json["concurrencyToken"] = concurrencyToken;
	json["checkpoint"] = checkpoint.has_value() ? Json(*checkpoint) : Json(nullptr);
	json["ownerSwitchesSinceCheckpoint"] = ownerSwitchesSinceCheckpoint;
	return json;
}

Lease Lease::FromJson(const Json& json)
{
	Lease lease;
	lease.key = json.at("leaseKey").get<std::string>();
	lease.owner = json.at("leaseOwner").get<std::string>();
	lease.counter = json.at("leaseCounter").get<int64_t>();
	lease.concurrencyToken = json.at("concurrencyToken").get<std::string>();
	if (json.contains("checkpoint") && !json["checkpoint"].is_null())
	{
		lease.checkpoint = json["checkpoint"].get<std::string>();
	}
	if (json.contains("ownerSwitchesSinceCheckpoint"))
	{
		lease.ownerSwitchesSinceCheckpoint = json["ownerSwitchesSinceCheckpoint"].get<int64_t>();
	}
	return lease;
}

std::string Lease::ToString() const
{
	return std::format("Lease(key={}, owner={}, counter={}, checkpoint={})", key, owner, counter,
					   checkpoint.value_or("<none>"));
}

bool Lease::operator==(const Lease& other) const
{
	return key == other.key && owner == other.owner && counter == other.counter &&
		   checkpoint == other.checkpoint &&
		   ownerSwitchesSinceCheckpoint == other.ownerSwitchesSinceCheckpoint;
}
