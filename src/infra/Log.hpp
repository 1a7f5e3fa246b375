#pragma once

#include <format>
#include <mutex>
#include <print>
#include <string>
#include <utility>

namespace Skirmish::Log {

	std::mutex& outputMutex();

	// Lines carry their own tag, e.g. log("[COMBAT] Created {}", id).
	template <typename... Args>
	void log(std::format_string<Args...> fmt, Args&&... args) {
		std::string line = std::format(fmt, std::forward<Args>(args)...);
		std::lock_guard lock(outputMutex());
		std::println("{}", line);
	}
}
