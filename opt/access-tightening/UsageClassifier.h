/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "AccessLevel.h"

class Declaration;
class Scope;
struct UsageSite;

/*
 * The knobs that decide how far declarations may be tightened.
 */
struct TighteningPolicy {
  // Also tighten static final fields with an initializer.
  bool suggest_for_constants{true};
  // Whether package-private may be suggested for members and nested types.
  bool suggest_package_local_for_members{true};
  // Whether package-private may be suggested for top-level types.
  bool suggest_package_local_for_top_classes{true};
  // Whether members of nested types may become private.
  bool suggest_private_for_inners{false};
  // Scan implicit functional conversions alongside the regular usages.
  bool parallel_usage_search{false};
};

/*
 * Computes the least access level a single usage site requires of the
 * member it references. The first matching rule wins:
 *
 *  1. The site's innermost type encloses the member's container, or is
 *     nested in that container and is not itself static: private, unless
 *     the member is referenced from an extends/implements list or an
 *     annotation argument, is abstract, is called on an instance of a
 *     subtype, or lives in a nested type while private members of nested
 *     types are not suggested. Those cases need package-private.
 *  2. The site is in the member's package and any qualifier expression has a
 *     type from that package: package-private.
 *  3. The member is qualified by an expression: public.
 *  4. The site is in a subtype of the container and is not a construction:
 *     protected.
 *  5. Otherwise: public.
 *
 * Wherever package-private applies but the policy forbids suggesting it,
 * the answer is public.
 */
class UsageClassifier {
 public:
  explicit UsageClassifier(const TighteningPolicy& policy)
      : m_policy(policy) {}

  AccessLevel classify(const UsageSite& site,
                       const Declaration* member,
                       const Declaration* container,
                       const Scope* declaring_scope) const;

  AccessLevel classify(const UsageSite& site,
                       const Declaration* member) const;

  /*
   * PACKAGE if the policy allows suggesting package-private for this kind of
   * declaration, PUBLIC otherwise.
   */
  AccessLevel package_local_level(const Declaration* member) const;

 private:
  bool is_local_access(const UsageSite& site,
                       const Declaration* container) const;

  TighteningPolicy m_policy;
};
