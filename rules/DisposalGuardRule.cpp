/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "DisposalGuardRule.h"

#include "Code.h"
#include "GeneratedCode.h"
#include "JsonWrapper.h"
#include "Method.h"
#include "MethodSignature.h"
#include "OpcodeBitmask.h"
#include "ReceiverTracer.h"
#include "Resolver.h"
#include "RuleContext.h"
#include "Show.h"
#include "Trace.h"
#include "TypeHierarchy.h"

namespace {

constexpr const char* DEFAULT_LIFECYCLE_INTERFACE = "System.IDisposable";
constexpr const char* DEFAULT_GUARD_EXCEPTION = "System.ObjectDisposedException";
constexpr const char* DEFAULT_DISPOSAL_METHOD = "Dispose";

// What one pass over a method body saw. Lives on the stack of a single
// check_method() call.
struct AnalysisState {
  bool saw_self_call{false};
  bool saw_self_field{false};
  bool saw_guard_exception{false};
  bool saw_guard_helper{false};

  bool touches_self() const { return saw_self_call || saw_self_field; }
  bool is_guarded() const { return saw_guard_exception || saw_guard_helper; }
};

// CheckDisposed, CheckIfClosedThrowDisposed, CheckObjectDisposedException...
bool is_guard_helper_name(const std::string& name) {
  return name.find("Check") != std::string::npos &&
         name.find("Dispose") != std::string::npos;
}

/*
 * A call to a non-public instance method of the caller's own type, made on
 * `self`.
 */
bool is_self_call(const Method& caller,
                  const Code& code,
                  size_t idx,
                  const MethodResolver& resolver) {
  const auto* callee = resolver.resolve(code.at(idx).get_method());
  if (callee == nullptr || is_public(callee) || is_static(callee) ||
      callee->get_class() != caller.get_class()) {
    return false;
  }
  return receiver::is_self(code, idx);
}

// An access to an instance field of the caller's own type through `self`.
bool is_self_field(const Method& caller, const Code& code, size_t idx) {
  if (code.at(idx).get_field().cls != caller.get_class()) {
    return false;
  }
  return receiver::is_self(code, idx);
}

} // namespace

DisposalGuardRule::DisposalGuardRule()
    : Rule("DisposalGuard",
           "A method of a disposable type does not throw the \"already "
           "disposed\" exception.",
           "Throw System.ObjectDisposedException if the object has been "
           "disposed."),
      m_lifecycle_interface(DEFAULT_LIFECYCLE_INTERFACE),
      m_guard_exception(DEFAULT_GUARD_EXCEPTION),
      m_disposal_method(DEFAULT_DISPOSAL_METHOD) {}

void DisposalGuardRule::configure(const JsonWrapper& config) {
  config.get("lifecycle_interface", std::string(DEFAULT_LIFECYCLE_INTERFACE),
             m_lifecycle_interface);
  config.get("guard_exception", std::string(DEFAULT_GUARD_EXCEPTION),
             m_guard_exception);
  config.get("disposal_method", std::string(DEFAULT_DISPOSAL_METHOD),
             m_disposal_method);
  TRACE(DGUARD, 1, "interface %s, exception %s, disposal method %s",
        m_lifecycle_interface.c_str(), m_guard_exception.c_str(),
        m_disposal_method.c_str());
}

bool DisposalGuardRule::is_exempt(const Method& method) const {
  if (is_constructor(&method) || is_finalizer(&method) ||
      method_signatures::finalize().matches(method)) {
    return true;
  }
  if (is_getter(&method) || is_event_accessor(&method)) {
    return true;
  }
  if (method_signatures::equals_one().matches(method) ||
      method_signatures::get_hash_code().matches(method) ||
      method_signatures::to_string().matches(method) ||
      method_signatures::close().matches(method)) {
    return true;
  }
  return method.get_name() == m_disposal_method;
}

bool DisposalGuardRule::is_eligible(const Method& method,
                                    const RuleContext& context) const {
  if (!method.has_code() || context.generated_code().is_generated_code(method)) {
    return false;
  }
  // Methods that neither call anything nor touch a field (say, stubs that
  // only throw NotImplementedException) cannot use the object's state.
  return is_public(&method) &&
         method.get_code()->opcodes().intersects(
             opcode_bitmask::calls_and_fields()) &&
         context.hierarchy().implements_interface(method.get_class(),
                                                  m_lifecycle_interface) &&
         !is_exempt(method);
}

RuleResult DisposalGuardRule::check_method(const Method& method,
                                           const RuleContext& context) const {
  if (!is_eligible(method, context)) {
    return RuleResult::DOES_NOT_APPLY;
  }
  const auto& code = *method.get_code();
  try {
    code.check_well_formed();
  } catch (const dispolint::MalformedCodeException& e) {
    TRACE(DGUARD, 1, "Skipping %s: %s", SHOW(method), e.what());
    return RuleResult::DOES_NOT_APPLY;
  }

  TRACE(DGUARD, 3, "Checking %s", SHOW(method));
  AnalysisState state;
  const auto& resolver = context.resolver();
  for (size_t i = 0; i < code.size(); ++i) {
    const auto& insn = code.at(i);
    switch (insn.opcode()) {
    case OPCODE_INVOKE_DIRECT:
    case OPCODE_INVOKE_VIRTUAL:
      if (!state.saw_self_call &&
          is_self_call(method, code, i, resolver)) {
        TRACE(DGUARD, 4, "found non-public self call at %s", SHOW(insn));
        state.saw_self_call = true;
      }
      if (!state.saw_guard_helper &&
          is_guard_helper_name(insn.get_method().name)) {
        TRACE(DGUARD, 4, "found dispose check at %s", SHOW(insn));
        state.saw_guard_helper = true;
      }
      break;
    case OPCODE_LOAD_FIELD:
    case OPCODE_LOAD_FIELD_ADDRESS:
    case OPCODE_STORE_FIELD:
      if (!state.saw_self_field && is_self_field(method, code, i)) {
        TRACE(DGUARD, 4, "found self field access at %s", SHOW(insn));
        state.saw_self_field = true;
      }
      break;
    case OPCODE_NEW_OBJECT:
      if (!state.saw_guard_exception &&
          insn.get_method().cls == m_guard_exception) {
        TRACE(DGUARD, 4, "creates guard exception at %s", SHOW(insn));
        state.saw_guard_exception = true;
      }
      break;
    default:
      break;
    }
  }

  if (state.touches_self() && !state.is_guarded()) {
    TRACE(DGUARD, 2, "%s uses its state without a disposal check",
          SHOW(method));
    context.report(method, Severity::MEDIUM, Confidence::HIGH);
    return RuleResult::FAILURE;
  }
  return RuleResult::SUCCESS;
}

namespace {
static DisposalGuardRule s_rule;
} // namespace
