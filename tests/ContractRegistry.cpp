#include "ContractRegistry.h"

#include <algorithm>
#include <iterator>

namespace stagehand::tests
{

ContractRegistry& ContractRegistry::Instance()
{
  static ContractRegistry registry;
  return registry;
}

void ContractRegistry::RegisterSuite(const std::string& domain,
                                     const std::string& suite_name,
                                     const std::vector<std::string>& rule_ids)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto& covered = coverage_[domain];
  covered.insert(rule_ids.begin(), rule_ids.end());
  suite_index_[domain].insert(suite_name);
}

bool ContractRegistry::IsRuleCovered(const std::string& domain,
                                     const std::string& rule_id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = coverage_.find(domain);
  return it != coverage_.end() && it->second.count(rule_id) > 0;
}

std::set<std::string> ContractRegistry::CoveredRules(const std::string& domain) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = coverage_.find(domain);
  if (it == coverage_.end())
  {
    return {};
  }
  return it->second;
}

std::vector<std::string> ContractRegistry::MissingRules(
    const std::string& domain,
    const std::vector<std::string>& expected) const
{
  const auto covered = CoveredRules(domain);
  std::vector<std::string> missing;
  std::copy_if(expected.begin(), expected.end(), std::back_inserter(missing),
               [&covered](const std::string& rule) { return covered.count(rule) == 0; });
  return missing;
}

void ContractRegistry::Reset()
{
  std::lock_guard<std::mutex> lock(mutex_);
  coverage_.clear();
  suite_index_.clear();
}

} // namespace stagehand::tests
