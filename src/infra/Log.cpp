#include "Log.hpp"

namespace Skirmish::Log {

	std::mutex& outputMutex() {
		static std::mutex mutex;
		return mutex;
	}
}
