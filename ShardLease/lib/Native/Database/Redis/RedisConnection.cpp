#include "RedisConnection.hpp"

#include <iterator>

std::optional<std::string> RedisConnection::Get(std::string_view key) const
{
	return WithSync([&](auto& r) -> std::optional<std::string> { return r.get(key); });
}

bool RedisConnection::SetIfAbsent(std::string_view key, std::string_view value) const
{
	return WithSync(
		[&](auto& r) -> bool
		{ return r.set(key, value, std::chrono::milliseconds(0), sw::redis::UpdateType::NOT_EXIST); });
}

long long RedisConnection::DelKey(std::string_view key) const
{
	return WithSync([&](auto& r) -> long long { return r.del(key); });
}

long long RedisConnection::SAdd(std::string_view key, std::string_view member) const
{
	return WithSync([&](auto& r) -> long long { return r.sadd(key, member); });
}

long long RedisConnection::SRem(std::string_view key, std::string_view member) const
{
	return WithSync([&](auto& r) -> long long { return r.srem(key, member); });
}

std::vector<std::string> RedisConnection::SMembers(std::string_view key) const
{
	return WithSync(
		[&](auto& r) -> std::vector<std::string>
		{
			std::vector<std::string> out;
			r.smembers(key, std::back_inserter(out));
			return out;
		});
}

std::string RedisConnection::EvalString(std::string_view script,
										std::initializer_list<std::string_view> keys,
										std::initializer_list<std::string_view> args) const
{
	return WithSync(
		[&](auto& r) -> std::string
		{ return r.template eval<std::string>(script, keys.begin(), keys.end(), args.begin(), args.end()); });
}
