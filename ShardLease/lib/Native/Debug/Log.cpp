#include "Log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <random>

Log::Log(const std::string& Who) : WhoIsTalking(Who)
{
	IdentifierColor = GetRandomTerminalColor();
}

void Log::InitFromEnv()
{
	const char* env = std::getenv("SHARDLEASE_LOG_LEVEL");
	if (!env)
		return;
	std::string v = env;
	for (auto& ch : v) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
	if (v == "ERROR")
		SetLevel(Level::Error);
	else if (v == "WARNING" || v == "WARN")
		SetLevel(Level::Warning);
	else if (v == "DEBUG")
		SetLevel(Level::Debug);
}

void Log::Emit(Level level, std::optional<TerminalColor> textColor, std::string_view str) const
{
	if (IsMuted() || GetLevel() < level)
		return;

	// Renewal tasks log from pool threads; keep lines whole.
	std::scoped_lock lock(write_mutex);
	std::cerr << GetTerminalColorCode(IdentifierColor, true) << WhoIsTalking << "> "
			  << ResetColor();
	if (textColor)
		std::cerr << GetTerminalColorCode(*textColor);
	std::cerr << str << ResetColor() << std::endl;
}

std::string Log::GetTerminalColorCode(TerminalColor color, bool foreground)
{
	const int base = foreground ? 30 : 40;		  // Foreground: 30-37, Background: 40-47
	const int brightBase = foreground ? 90 : 100;  // Bright: 90-97, 100-107

	const int index = static_cast<int>(color);
	if (index < 0 || index > static_cast<int>(TerminalColor::BrightWhite))
		return ResetColor();
	if (index <= static_cast<int>(TerminalColor::White))
		return "\033[" + std::to_string(base + index) + "m";
	return "\033[" + std::to_string(brightBase + index - static_cast<int>(TerminalColor::BrightBlack)) +
		   "m";
}

Log::TerminalColor Log::GetRandomTerminalColor()
{
	static std::mutex genMutex;
	static std::random_device rd;
	static std::mt19937 gen(rd());
	// Skip Black/Red so component names never look like errors.
	static std::uniform_int_distribution<int> dist(static_cast<int>(TerminalColor::Green),
												   static_cast<int>(TerminalColor::BrightWhite));

	std::scoped_lock lock(genMutex);
	return static_cast<TerminalColor>(dist(gen));
}
