#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace pricecast::core {

/**
 * @class PipelineError
 * @brief Base class for failures raised by a pipeline stage.
 *
 * Carries the stage that failed and, where it applies, the model name and the
 * walk-forward fold index so that callers can decide whether to retry with a
 * different configuration.
 */
class PipelineError : public std::runtime_error {
public:
	PipelineError(const std::string &message, std::string stage, std::string model_name = {},
	              std::optional<std::size_t> fold_index = std::nullopt);

	const std::string &stage() const noexcept {
		return stage_;
	}

	const std::string &modelName() const noexcept {
		return model_name_;
	}

	const std::optional<std::size_t> &foldIndex() const noexcept {
		return fold_index_;
	}

	/// The message without the context prefix.
	const std::string &detail() const noexcept {
		return detail_;
	}

private:
	std::string detail_;
	std::string stage_;
	std::string model_name_;
	std::optional<std::size_t> fold_index_;
};

/// Bar dates are not strictly increasing (out of order or duplicated).
class InvalidSeriesError final : public PipelineError {
public:
	using PipelineError::PipelineError;
};

/// Not enough rows for the requested lookback, horizon or split count.
class InsufficientHistoryError final : public PipelineError {
public:
	using PipelineError::PipelineError;
};

/// A model name that is not in the registry.
class UnknownModelError final : public PipelineError {
public:
	using PipelineError::PipelineError;
};

} // namespace pricecast::core
