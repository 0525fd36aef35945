#include "internal/util/time.hpp"

#include <cassert>
#include <iostream>
#include <thread>

namespace {

using fleet::util::ParseMillis;
using namespace std::chrono_literals;

void TestParseMillisAcceptsDigits() {
  assert(ParseMillis("0") == 0u);
  assert(ParseMillis("1500") == 1500u);
  assert(ParseMillis("007") == 7u);
  assert(ParseMillis("9223372036854775807") == 9223372036854775807u);
}

void TestParseMillisRejectsEverythingElse() {
  assert(!ParseMillis(""));
  assert(!ParseMillis("abc"));
  assert(!ParseMillis("10s"));
  assert(!ParseMillis("1.5"));
  assert(!ParseMillis("-1"));
  assert(!ParseMillis("+1"));
  assert(!ParseMillis(" 10"));
  assert(!ParseMillis("10 "));
  assert(!ParseMillis("9223372036854775808"));
  assert(!ParseMillis("99999999999999999999999"));
}

void TestDeadlineHelpers() {
  const auto start = fleet::util::Now();
  assert(fleet::util::RemainingMillis(start - 1s) == 0);
  assert(fleet::util::RemainingMillis(start + 10s) > 9000);

  std::this_thread::sleep_for(20ms);
  assert(fleet::util::MillisSince(start) >= 20);
}

} // namespace

int main() {
  TestParseMillisAcceptsDigits();
  TestParseMillisRejectsEverythingElse();
  TestDeadlineHelpers();

  std::cout << "fleet_unit_time: pass\n";
  return 0;
}
