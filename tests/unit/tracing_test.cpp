#include "internal/observability/spans.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/inventory/inventory_resolver.hpp"
#include "internal/invoke/invocation_pool.hpp"
#include "internal/invoke/module_channel.hpp"

namespace {

using fleet::observability::SpanScope;

void TestDisabledTracingStaysOff() {
  auto config = fleet::config::ConfigLoader::Defaults();
  assert(!config.observability().tracing_enabled());
  assert(!fleet::observability::InitializeTracing(config));

  SpanScope span("fleet.test");
  assert(!span.recording());
  fleet::observability::ShutdownTracing();
}

void TestSpanScopeIsSafeWithoutTracer() {
  SpanScope span("fleet.test");
  span.SetAttribute("module", std::string("/bin/true"));
  span.SetAttribute("exit_code", static_cast<std::int64_t>(0));
  span.SetAttribute("changed", true);
  span.AddEvent("source_skipped");
  span.RecordException("boom");

  SpanScope moved(std::move(span));
  moved.SetAttribute("after_move", static_cast<std::int64_t>(1));
  assert(!moved.recording());
}

#ifndef FLEET_ENABLE_OTEL
void TestBuildsWithoutExporterNeverTrace() {
  auto config = fleet::config::ConfigLoader::Defaults();
  config.mutable_observability()->set_tracing_enabled(true);
  assert(!fleet::observability::InitializeTracing(config));
}
#endif

// Instrumented paths run the same with tracing off.
void TestInstrumentedCallsWithoutTracer() {
  auto channel = std::make_shared<const fleet::invoke::ModuleChannel>();
  auto result  = channel->Invoke(std::string(FLEET_TEST_FIXTURES_DIR) + "/bin/ensure_present.sh", {}, std::chrono::seconds(10));
  assert(fleet::invoke::Succeeded(result));

  auto pool = std::make_shared<fleet::invoke::InvocationPool>(channel, 1);
  fleet::inventory::InventoryResolver resolver({}, std::make_shared<const fleet::inventory::SourceLoader>(channel, pool));
  const auto resolved = resolver.Resolve({fleet::inventory::StaticSource{std::string(FLEET_TEST_FIXTURES_DIR) + "/inventory/base.json"}});
  assert(resolved->HasHost("web1"));
  pool->Stop();
}

} // namespace

int main() {
  TestDisabledTracingStaysOff();
  TestSpanScopeIsSafeWithoutTracer();
#ifndef FLEET_ENABLE_OTEL
  TestBuildsWithoutExporterNeverTrace();
#endif
  TestInstrumentedCallsWithoutTracer();

  std::cout << "fleet_unit_tracing: pass\n";
  return 0;
}
