/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "Finding.h"

class GeneratedCodeMarker;
class Method;
class MethodResolver;
class Rule;
class TypeHierarchy;

/*
 * What a rule may consult while checking a method, and where it reports.
 * A context is bound to one rule; report() stamps that rule's identity on
 * the finding.
 */
class RuleContext final {
 public:
  RuleContext(const TypeHierarchy& hierarchy,
              const MethodResolver& resolver,
              const GeneratedCodeMarker& generated,
              Reporter& reporter,
              const Rule& rule)
      : m_hierarchy(hierarchy),
        m_resolver(resolver),
        m_generated(generated),
        m_reporter(reporter),
        m_rule(rule) {}

  const TypeHierarchy& hierarchy() const { return m_hierarchy; }
  const MethodResolver& resolver() const { return m_resolver; }
  const GeneratedCodeMarker& generated_code() const { return m_generated; }
  const Rule& rule() const { return m_rule; }

  void report(const Method& method,
              Severity severity,
              Confidence confidence) const;

 private:
  const TypeHierarchy& m_hierarchy;
  const MethodResolver& m_resolver;
  const GeneratedCodeMarker& m_generated;
  Reporter& m_reporter;
  const Rule& m_rule;
};
