#pragma once

#include <lunajudge/common/expected.hpp>      // IWYU pragma: export
#include <lunajudge/execution_result.hpp>     // IWYU pragma: export
#include <lunajudge/executor.hpp>             // IWYU pragma: export
#include <lunajudge/executor_config.hpp>      // IWYU pragma: export
#include <lunajudge/logging.hpp>              // IWYU pragma: export
#include <lunajudge/value/comparator.hpp>     // IWYU pragma: export
#include <lunajudge/value/value.hpp>          // IWYU pragma: export
