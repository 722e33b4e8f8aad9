#pragma once
/** @file  MockErrorMonitor.hpp
 *  @brief gmock ErrorMonitor used to observe fatal-fault escalation.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <string>

#include <gmock/gmock.h>

#include "core/ErrorMonitor.hpp"

namespace kpm {
  namespace test {

    class MockErrorMonitor : public kpm::core::ErrorMonitor {
    public:
      MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    };

  } // namespace test
} // namespace kpm
