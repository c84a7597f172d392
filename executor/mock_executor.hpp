#ifndef EXECUTOR_MOCK_EXECUTOR_HPP
#define EXECUTOR_MOCK_EXECUTOR_HPP

#include "executor/executor.hpp"
#include "gmock/gmock.h"

namespace executor {

class MockExecutor : public Executor {
 public:
  explicit MockExecutor(ToolchainChecker* checker) : Executor(checker) {
    ON_CALL(*this, Id()).WillByDefault(::testing::Return("MOCK"));
    ON_CALL(*this, HostPrograms(::testing::_))
        .WillByDefault(::testing::ReturnArg<0>());
    ON_CALL(*this, IsolatesNetwork()).WillByDefault(::testing::Return(true));
  }

  MOCK_CONST_METHOD0(Id, std::string());
  MOCK_METHOD1(Run, proto::ExecutionResult(const Request& request));
  MOCK_CONST_METHOD1(HostPrograms, std::vector<std::string>(
                                       const std::vector<std::string>& tools));
  MOCK_CONST_METHOD0(IsolatesNetwork, bool());
};

}  // namespace executor

#endif
