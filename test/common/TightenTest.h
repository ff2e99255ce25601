/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>
#include <gtest/gtest.h>

#include "AccessLevel.h"
#include "CancellationToken.h"
#include "DeclarationGraph.h"
#include "EntryPoints.h"
#include "Extensibility.h"
#include "UsageClassifier.h"
#include "UsageIndex.h"
#include "UsageSite.h"

/*
 * A fresh graph and usage index per test, with shorthands to populate them.
 */
struct TightenTest : public testing::Test {
 protected:
  // Top-level type `pkg.name`.
  Declaration* make_type(const std::string& pkg,
                         const std::string& name,
                         DeclAccessFlags access = ACC_PUBLIC);

  // Type nested in `outer`.
  Declaration* make_nested_type(const Declaration* outer,
                                const std::string& name,
                                DeclAccessFlags access = ACC_PUBLIC);

  Declaration* make_method(const Declaration* container,
                           const std::string& name,
                           DeclAccessFlags access = ACC_PUBLIC);

  Declaration* make_field(const Declaration* container,
                          const std::string& name,
                          DeclAccessFlags access = ACC_PUBLIC);

  // An unqualified reference from within `from`.
  UsageSite site_from(const Declaration* from) const;

  // A reference from a file of package `pkg` outside of any type.
  UsageSite site_in_package(const std::string& pkg);

  // A reference from a non-source descriptor.
  UsageSite non_source_site() const;

  // `qualifier_type` may be nullptr for an unresolved qualifier.
  UsageSite qualified_site_from(const Declaration* from,
                                const Declaration* qualifier_type) const;

  void add_usage(const Declaration* target, const UsageSite& site) {
    index.add_usage(target, site);
  }

  /*
   * Resolves `decl` against the fixture's index with the given policy and
   * no entry points or extensibility providers.
   */
  boost::optional<AccessLevel> suggest(
      const Declaration* decl,
      const TighteningPolicy& policy = TighteningPolicy()) const;

  DeclarationGraph graph;
  InMemoryUsageIndex index;
  CancellationToken token;
  EntryPointOracle no_entry_points;
  ExtensibilityOracle no_extensibility;
};
