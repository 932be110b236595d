#include <lunajudge/execution_result.hpp>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find_if.hpp>

namespace lunajudge {

int ExecutionResult::passed_count() const {
    return static_cast<int>(ranges::count_if(test_results, &TestResult::passed));
}

const TestResult* ExecutionResult::first_failure() const {
    auto iter = ranges::find_if(test_results, [](const TestResult& res) { return !res.passed; });

    if (iter == test_results.end()) {
        return nullptr;
    }

    return &*iter;
}

TestStatus ExecutionResult::status() const {
    if (const TestResult* failure = first_failure()) {
        return failure->status;
    }

    return TestStatus::Accepted;
}

} // namespace lunajudge
