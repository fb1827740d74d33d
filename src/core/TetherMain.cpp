/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/IdentityConfig.hpp"
#include "core/Logger.hpp"
#include "identity/IdentityService.hpp"
#include "identity/ReferenceField.hpp"
#include "scene/ScenePool.hpp"
#include <exception>
#include <format>
#include <iostream>
#include <string>

namespace {

const std::string DEFAULT_CONFIG{"res/tether.json"};

struct DemoResult {
  int failures{0};

  void expect(bool condition, const std::string& what) {
    if (condition) {
      DEMO_INFO("ok: " + what);
    } else {
      DEMO_ERROR("FAILED: " + what);
      ++failures;
    }
  }
};

// Two unread entities, then an out-of-band copy of the second one
void runDuplicationScenario(Tether::ScenePool& pool, Tether::IdentityService& service,
                            DemoResult& result) {
  using namespace Tether;
  IdentityResolver& objects = service.resolver(CollectionKind::Object);
  const StableId start = service.config().counterStart;

  EntityHandle a = pool.createEntity(CollectionKind::Object, "Scene", "A");
  EntityHandle b = pool.createEntity(CollectionKind::Object, "Scene", "B");

  const StableId idA = objects.ensureId(a);
  const StableId idB = objects.ensureId(b);
  result.expect(idA == start && idB == start + 1,
                std::format("ensureId(A)={} ensureId(B)={}", idA, idB));

  EntityHandle c = pool.duplicate(b);
  result.expect(pool.getStoredId(c) == idB, "duplicate C carries B's stored id");

  const StableId idC = objects.ensureId(c);
  result.expect(idC == start + 2, std::format("ensureId(C) repaired to {}", idC));
  result.expect(objects.peekId(b) == idB, "B keeps its id");
}

// A reference keeps pointing at its target through a rename
void runRenameScenario(Tether::ScenePool& pool, Tether::IdentityService& service,
                       DemoResult& result) {
  using namespace Tether;

  EntityHandle owner = pool.createEntity(CollectionKind::Object, "Layout", "Rig");
  EntityHandle target = pool.findByName(CollectionKind::Object, "A");

  ReferenceField field(pool, service.resolver(CollectionKind::Object), "target",
                       {"Target", {}});
  field.set(owner, target);
  pool.rename(target, "Foo");

  result.expect(field.get(owner) == target, "reference resolves to A after rename");
  result.expect(field.displayValue(owner) == "Foo",
                std::format("display value is '{}'", field.displayValue(owner)));

  pool.destroy(target);
  result.expect(!field.get(owner).has_value(), "reference is unresolved after delete");
}

} // anonymous namespace

// Usage: tether_demo [--quiet] [config.json]
int main(int argc, char* argv[]) {
  std::string configPath = DEFAULT_CONFIG;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--quiet") {
      TETHER_ENABLE_QUIET_MODE();
    } else {
      configPath = arg;
    }
  }

  Tether::IdentityConfig config;
  if (!config.loadFromFile(configPath)) {
    DEMO_WARN("Failed to load " + configPath + " - using defaults");
  }

  DemoResult result;
  try {
    Tether::ScenePool pool;
    pool.createNamespace("Scene");
    pool.createNamespace("Layout");

    Tether::IdentityService service(pool, config);
    service.onPoolLoaded();

    runDuplicationScenario(pool, service, result);
    runRenameScenario(pool, service, result);

    DEMO_INFO(std::format("Namespace counters in sync: Scene={} Layout={}",
                          service.registry(Tether::CollectionKind::Object).namespaceCounter("Scene"),
                          service.registry(Tether::CollectionKind::Object).namespaceCounter("Layout")));
  } catch (const std::exception& e) {
    DEMO_CRITICAL(std::format("Demo aborted: {}", e.what()));
    return 1;
  }

  if (result.failures > 0) {
    std::cout << "Tether demo: " << result.failures << " check(s) failed\n";
    return 1;
  }

  std::cout << "Tether demo: all checks passed\n";
  return 0;
}
