#pragma once
#include <memory>
#include <mutex>
#include <type_traits>
template <typename Type>
class Singleton
{
   private:
	static inline std::mutex Mutex;
	static inline std::unique_ptr<Type> Instance;

   protected:
	Singleton() = default;

   public:
	Singleton(const Singleton&) = delete;
	Singleton& operator=(const Singleton&) = delete;

	// Get: constructs ONLY if default-constructible
	[[nodiscard]] static Type& Get()
	{
		std::lock_guard lock(Mutex);

		if (!Instance)
		{
			static_assert(std::is_default_constructible_v<Type>,
						  "Singleton type must be default constructible to use Get()");
			Instance = std::make_unique<Type>();
		}

		return *Instance;
	}
};
