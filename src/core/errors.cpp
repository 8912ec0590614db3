#include "pricecast/core/errors.hpp"

#include <sstream>
#include <utility>

namespace pricecast::core {

namespace {

std::string withContext(const std::string &message, const std::string &stage, const std::string &model_name,
                        const std::optional<std::size_t> &fold_index) {
	std::ostringstream oss;
	oss << "[" << stage;
	if (!model_name.empty()) {
		oss << ", model '" << model_name << "'";
	}
	if (fold_index) {
		oss << ", fold " << *fold_index;
	}
	oss << "] " << message;
	return oss.str();
}

} // namespace

PipelineError::PipelineError(const std::string &message, std::string stage, std::string model_name,
                             std::optional<std::size_t> fold_index)
    : std::runtime_error(withContext(message, stage, model_name, fold_index)), detail_(message),
      stage_(std::move(stage)), model_name_(std::move(model_name)), fold_index_(fold_index) {
}

} // namespace pricecast::core
