#pragma once
#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

class Log
{
   public:
	Log() = default;
	Log(const std::string& Who);

	enum class Level
	{
		Error = 0,
		Warning = 1,
		Debug = 2,
	};

	std::string WhoIsTalking;

	template <typename... Args>
	void ErrorFormatted(std::string_view fmt, Args&&... args) const
	{
		Error(std::vformat(fmt, std::make_format_args(args...)));
	}
	void Error(std::string_view str) const { Emit(Level::Error, TerminalColor::Red, str); }

	template <typename... Args>
	void WarningFormatted(std::string_view fmt, Args&&... args) const
	{
		Warning(std::vformat(fmt, std::make_format_args(args...)));
	}
	void Warning(std::string_view str) const
	{
		Emit(Level::Warning, TerminalColor::Yellow, str);
	}

	template <typename... Args>
	void DebugFormatted(std::string_view fmt, Args&&... args) const
	{
		Debug(std::vformat(fmt, std::make_format_args(args...)));
	}
	void Debug(std::string_view str) const { Emit(Level::Debug, std::nullopt, str); }

	enum class TerminalColor
	{
		Black,
		Red,
		Green,
		Yellow,
		Blue,
		Magenta,
		Cyan,
		White,
		BrightBlack,
		BrightRed,
		BrightGreen,
		BrightYellow,
		BrightBlue,
		BrightMagenta,
		BrightCyan,
		BrightWhite,
	};
	static std::string GetTerminalColorCode(TerminalColor color, bool foreground = true);

	static TerminalColor GetRandomTerminalColor();

	static void SetMuted(bool value) { muted.store(value, std::memory_order_relaxed); }
	static bool IsMuted() { return muted.load(std::memory_order_relaxed); }
	static void SetLevel(Level new_level)
	{
		log_level.store(static_cast<int>(new_level), std::memory_order_relaxed);
	}
	static Level GetLevel() { return static_cast<Level>(log_level.load(std::memory_order_relaxed)); }

	// Reads SHARDLEASE_LOG_LEVEL (ERROR, WARNING/WARN, DEBUG). Unknown values are ignored.
	static void InitFromEnv();

   private:
	TerminalColor IdentifierColor = TerminalColor::White;

	void Emit(Level level, std::optional<TerminalColor> textColor, std::string_view str) const;

	inline static std::mutex write_mutex;
	inline static std::atomic_bool muted{false};
	inline static std::atomic<int> log_level{static_cast<int>(Level::Debug)};

	static inline std::string ResetColor() { return "\033[0m"; }
};
