#pragma once

#include "Enums.hpp"
#include <stdexcept>
#include <string>

namespace Skirmish {

	class SkirmishError : public std::runtime_error {
	public:
		SkirmishError(ErrorKind kind, const std::string& message)
			: std::runtime_error(message), kind_(kind) {}

		ErrorKind kind() const { return kind_; }

	private:
		ErrorKind kind_;
	};

	// Bad request shape, duplicate squares, unknown preset mode. Never retried.
	class ClientFault : public SkirmishError {
	public:
		explicit ClientFault(const std::string& message)
			: SkirmishError(ErrorKind::ClientFault, message) {}
	};

	class NotFound : public SkirmishError {
	public:
		explicit NotFound(const std::string& message)
			: SkirmishError(ErrorKind::NotFound, message) {}
	};

	class Unauthorized : public SkirmishError {
	public:
		explicit Unauthorized(const std::string& message)
			: SkirmishError(ErrorKind::Unauthorized, message) {}
	};

	// Persistence write failures. Details are logged, the caller sees an opaque message.
	class InternalFault : public SkirmishError {
	public:
		explicit InternalFault(const std::string& message = "Internal server error")
			: SkirmishError(ErrorKind::InternalFault, message) {}
	};

	inline int httpStatusFor(ErrorKind kind) {
		switch (kind) {
		case ErrorKind::ClientFault: return 400;
		case ErrorKind::Unauthorized: return 401;
		case ErrorKind::NotFound: return 404;
		case ErrorKind::InternalFault: return 500;
		}
		return 500;
	}
}
