#include "internal/cache/model_cache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/compiler/model_compiler.hpp"
#include "internal/registry/builtin_schemas.hpp"

namespace {

using annoschema::cache::ModelCache;
using annoschema::cache::ModelPtr;
using annoschema::compiler::ModelCompiler;
using annoschema::model::TableDefinition;

void TestSecondLookupSkipsCompilation() {
  ModelCache    cache;
  ModelCompiler compiler;
  int           compiles = 0;

  auto compile = [&] {
    ++compiles;
    return compiler.Compile("pinky", "synapse", annoschema::registry::SynapseSchema(), 1);
  };

  auto first  = cache.GetOrCompile("pinky", "synapse", 1, compile);
  auto second = cache.GetOrCompile("pinky", "synapse", 1, compile);

  assert(compiles == 1);
  assert(first.get() == second.get());
  assert(*first == *second);
  assert(cache.Size() == 1);
}

void TestKeysAreIsolatedByDatasetTableAndVersion() {
  ModelCache    cache;
  ModelCompiler compiler;
  int           compiles = 0;

  auto make = [&](const std::string& dataset, const std::string& table, annoschema::model::Version version) {
    return cache.GetOrCompile(dataset, table, version, [&] {
      ++compiles;
      return compiler.Compile(dataset, table, annoschema::registry::SynapseSchema(), version);
    });
  };

  auto a = make("pinky", "synapse", 1);
  auto b = make("pinky", "synapse", 2);
  auto c = make("basil", "synapse", 1);
  auto d = make("pinky", "synapse_b", 1);

  assert(compiles == 4);
  assert(a != b && a != c && a != d);
  assert(cache.Contains("pinky", "synapse", 2));
  assert(!cache.Contains("pinky", "synapse", 3));
  assert(cache.Get("basil", "synapse", 1).value() == c);
  assert(!cache.Get("basil", "synapse", 2).has_value());
}

void TestFailedCompilationIsNotStored() {
  ModelCache cache;

  bool threw = false;
  try {
    (void)cache.GetOrCompile("pinky", "broken", 1, []() -> TableDefinition { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!cache.Contains("pinky", "broken", 1));
  assert(cache.Size() == 0);

  // the key can still be compiled later
  auto model = cache.GetOrCompile("pinky", "broken", 1, [] { return ModelCompiler().CompileRoot("pinky", 1); });
  assert(model != nullptr);
  assert(cache.Contains("pinky", "broken", 1));
}

void TestConcurrentFirstAccessCompilesOnce() {
  ModelCache       cache;
  ModelCompiler    compiler;
  std::atomic<int> compiles{0};

  constexpr int            kThreads = 16;
  std::vector<ModelPtr>    results(kThreads);
  std::vector<std::thread> threads;
  std::atomic<bool>        go{false};

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      results[i] = cache.GetOrCompile("pinky", "synapse", 7, [&] {
        compiles.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return compiler.Compile("pinky", "synapse", annoschema::registry::SynapseSchema(), 7);
      });
    });
  }

  go.store(true);
  for (auto& thread : threads) thread.join();

  assert(compiles.load() == 1);
  for (const auto& result : results) {
    assert(result != nullptr);
    assert(result.get() == results[0].get());
  }
}

} // namespace

int main() {
  TestSecondLookupSkipsCompilation();
  TestKeysAreIsolatedByDatasetTableAndVersion();
  TestFailedCompilationIsNotStored();
  TestConcurrentFirstAccessCompilesOnce();

  std::cout << "annoschema_unit_model_cache: pass\n";
  return 0;
}
