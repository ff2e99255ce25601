/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "AccessLevel.h"
#include "ConcurrentContainers.h"

class Declaration;
class DeclarationGraph;

/*
 * The loosest level required by the direct members of each container type.
 * Updates are a compare-and-max under the lock of the container's shard, so
 * members may be recorded from any thread.
 */
class ContainerLevels {
 public:
  void record(const Declaration* container, AccessLevel level) {
    m_levels.update(container,
                    [level](const Declaration*, AccessLevel& current, bool) {
                      current = join(current, level);
                    });
  }

  // PRIVATE for containers without recorded members.
  AccessLevel get(const Declaration* container) const {
    return m_levels.get(container, AccessLevel::PRIVATE);
  }

  size_t size() const { return m_levels.size(); }

 private:
  ConcurrentMap<const Declaration*, AccessLevel> m_levels;
};

/*
 * Enforces that no type is suggested a level stricter than what its own
 * members need, nested types included. Types are visited deepest first, so a
 * nested type's requirement is final before its container looks at it.
 *
 * `resolved` is indexed by DeclId and holds the level the resolver settled on
 * for each declaration, whether or not it is stricter than the current one,
 * and boost::none where resolution failed. `suggestions` is indexed the same
 * way and holds the emitted suggestions; those violating containment are
 * reset to boost::none.
 */
class ContainmentAggregator {
 public:
  using Levels = std::vector<boost::optional<AccessLevel>>;

  ContainmentAggregator(const DeclarationGraph& graph, unsigned num_threads)
      : m_graph(graph), m_num_threads(num_threads) {}

  // Returns the number of withdrawn suggestions.
  size_t aggregate(const Levels& resolved,
                   Levels& suggestions,
                   ContainerLevels& levels) const;

  /*
   * What `decl` requires of its container: its resolved level, or its
   * current level if it was not resolved. Malformed declarations count as
   * PUBLIC.
   */
  static AccessLevel required_level(const Declaration* decl,
                                    const Levels& resolved);

 private:
  const DeclarationGraph& m_graph;
  unsigned m_num_threads;
};
