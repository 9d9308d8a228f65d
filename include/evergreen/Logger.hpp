//
// Created by chris on 1/7/26.
//

#ifndef EVERGREEN_LOGGER_HPP
#define EVERGREEN_LOGGER_HPP
#include <filesystem>
#include <source_location>
#include <string_view>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

/**
 * @brief Process-wide logger for the scene core and the viewer
 *
 * Console output is colored and filtered by build type, the file sink at
 * LOG_FILE always records everything. instance() stamps the caller's
 * file and line into the pattern, so every message shows where it came from.
 */
class Logger : public spdlog::logger
{
	std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> m_console_sink;
	std::shared_ptr<spdlog::sinks::basic_file_sink_mt>	 m_file_sink;

	Logger()
		: logger("Evergreen")
		, m_console_sink(std::make_shared<spdlog::sinks::stdout_color_sink_mt>())
		, m_file_sink(std::make_shared<spdlog::sinks::basic_file_sink_mt>(LOG_FILE, true))
	{
#ifndef NDEBUG
		m_console_sink->set_level(spdlog::level::debug);
#else
		m_console_sink->set_level(spdlog::level::warn);
#endif
		m_file_sink->set_level(spdlog::level::trace);
		set_level(spdlog::level::trace);
		sinks().push_back(m_console_sink);
		sinks().push_back(m_file_sink);
	}

public:
	static Logger& instance(std::source_location loc = std::source_location::current())
	{
		static Logger logger;
		auto file	 = std::filesystem::path{loc.file_name()}.filename().string();
		auto pattern = fmt::format("[Evergreen]{:<32}[%^%5l%$] %v", fmt::format("[{}:{}]", file, loc.line()));
		logger.set_pattern(pattern);
		return logger;
	}

	/// Only affects the console; the file sink keeps recording at trace.
	void set_console_level(spdlog::level::level_enum level) { m_console_sink->set_level(level); }

	[[nodiscard]] static constexpr std::string_view file_path() { return LOG_FILE; }
};

#endif // EVERGREEN_LOGGER_HPP
