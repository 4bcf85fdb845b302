#include <multitest/common/error.hpp>

namespace multitest::common {

error::error(std::string message) : chain_{std::move(message)} {}

error error::context(std::string message) const {
  auto wrapped = error{std::move(message)};
  wrapped.chain_.insert(std::end(wrapped.chain_), std::begin(chain_),
                        std::end(chain_));
  return wrapped;
}

const std::string& error::message() const {
  return chain_.front();
}

const std::string& error::root_cause() const {
  return chain_.back();
}

const std::vector<std::string>& error::chain() const {
  return chain_;
}

std::string error::what() const {
  auto rendered = std::string{};
  for (const auto& cause : chain_) {
    if (!rendered.empty()) {
      rendered.append(": ");
    }
    rendered.append(cause);
  }
  return rendered;
}

}  // namespace multitest::common
