#pragma once
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>
#include <string>

using UUID = boost::uuids::uuid;
class UUIDGen
{
   public:
	static UUID Gen()
	{
		// random_generator is not thread safe; stores mint tokens from pool threads.
		static std::mutex genMutex;
		static boost::uuids::random_generator generator;
		std::scoped_lock lock(genMutex);
		return generator();
	}

	// Fresh concurrency token in canonical 36 char form.
	static std::string GenString() { return boost::uuids::to_string(Gen()); }
};
