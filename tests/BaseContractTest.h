#ifndef STAGEHAND_TESTS_BASE_CONTRACT_TEST_H_
#define STAGEHAND_TESTS_BASE_CONTRACT_TEST_H_

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "ContractRegistry.h"

namespace stagehand::tests
{

// Base fixture for contract suites. A suite names its domain and the rule
// IDs it exercises; SetUp records the claim in the ContractRegistry.
class BaseContractTest : public ::testing::Test
{
protected:
  [[nodiscard]] virtual std::string DomainName() const = 0;
  [[nodiscard]] virtual std::vector<std::string> CoveredRuleIds() const = 0;

  void SetUp() override
  {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    ContractRegistry::Instance().RegisterSuite(
        DomainName(), info ? info->test_suite_name() : "unknown", CoveredRuleIds());
  }
};

} // namespace stagehand::tests

#endif // STAGEHAND_TESTS_BASE_CONTRACT_TEST_H_
