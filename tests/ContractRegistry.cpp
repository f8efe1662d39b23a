#include "ContractRegistry.h"

namespace vidsync::tests {

ContractRegistry& ContractRegistry::Instance() {
  static ContractRegistry registry;
  return registry;
}

void ContractRegistry::RecordSuite(const std::string& domain, const std::string& suite_name,
                                   const std::vector<std::string>& rule_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& rules = rules_[domain];
  for (const auto& rule : rule_ids) {
    rules[rule].insert(suite_name);
  }
}

bool ContractRegistry::HasDomain(const std::string& domain) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_.count(domain) > 0;
}

std::vector<std::string> ContractRegistry::UncoveredRules(
    const std::string& domain, const std::vector<std::string>& expected) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> uncovered;
  auto it = rules_.find(domain);
  for (const auto& rule : expected) {
    if (it == rules_.end() || it->second.count(rule) == 0) {
      uncovered.push_back(rule);
    }
  }
  return uncovered;
}

std::set<std::string> ContractRegistry::SuitesFor(const std::string& domain) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> suites;
  auto it = rules_.find(domain);
  if (it == rules_.end()) return suites;
  for (const auto& [rule, names] : it->second) {
    suites.insert(names.begin(), names.end());
  }
  return suites;
}

}  // namespace vidsync::tests
