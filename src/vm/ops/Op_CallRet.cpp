//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the call and return handlers.  A call pops its arguments, binds
// them to locals 0..N-1 of a new frame in call order and pushes that frame;
// the caller's pc is only advanced when the callee returns.
//
//===----------------------------------------------------------------------===//

#include "vm/OpHandlers_Control.hpp"

#include "vm/Fault.hpp"
#include "vm/OpHandlers_Memory.hpp"

#include <string>
#include <vector>

namespace jade::vm::detail::control
{
namespace
{
bool isRootConstructor(const bc::MethodId &m)
{
    return m.className == memory::kObjectClass && m.name == "<init>";
}
} // namespace

/// @brief Push a frame for the callee.
/// @details `java/lang/Object.<init>` has no body: it consumes its receiver and
///          advances.  Special and virtual calls take the receiver as local 0
///          and halt with a null-pointer outcome when it is null.  Virtual
///          calls resolve to the named method; there is no override lookup.
HandlerResult handleInvoke(ExecState &state, InstructionStore &store, const bc::ins::Invoke &in)
{
    Frame &caller = state.top();
    const bool hasReceiver = in.kind != bc::InvokeKind::Static;

    if (hasReceiver && isRootConstructor(in.method))
    {
        popRef(caller);
        advance(caller);
        return std::nullopt;
    }

    const size_t argc = in.method.params.size() + (hasReceiver ? 1 : 0);
    std::vector<Value> args(argc);
    for (size_t i = argc; i > 0; --i)
        args[i - 1] = caller.stack.pop();

    if (hasReceiver)
    {
        if (args.front().kind != Value::Kind::Reference)
            throw ExecutionFault(FaultKind::TypeMismatch,
                                 "receiver of " + in.method.toString() + " is not a reference");
        if (args.front().isNull())
            return Outcome::NullPointer;
    }

    // Resolve the body now so an unknown callee faults at the call site.
    store.get(in.method);

    Frame callee = makeFrame(store.intern(in.method));
    for (size_t i = 0; i < argc; ++i)
        callee.setLocal(static_cast<std::uint32_t>(i), std::move(args[i]));
    state.frames.push_back(std::move(callee));
    return std::nullopt;
}

/// @brief Pop the current frame and hand the result to the caller.
/// @details Returning from the entry frame records the value in the state and
///          halts with `ok`.
HandlerResult handleReturn(ExecState &state, const bc::ins::Return &in)
{
    std::optional<Value> result;
    if (in.type)
    {
        Value v = state.top().stack.pop();
        if (!matchesType(v, *in.type))
            throw ExecutionFault(FaultKind::TypeMismatch,
                                 "return " + in.type->toString() + " with " +
                                     kindToString(v.kind));
        result = std::move(v);
    }

    state.frames.pop_back();
    if (state.frames.empty())
    {
        state.returned = std::move(result);
        return Outcome::Ok;
    }

    Frame &caller = state.top();
    if (result)
        caller.stack.push(std::move(*result));
    advance(caller);
    return std::nullopt;
}

} // namespace jade::vm::detail::control
