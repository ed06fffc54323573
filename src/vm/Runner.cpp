//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Runner facade: initial-state construction, the bounded step
// loop and the JADE_MAX_STEPS override.
//
//===----------------------------------------------------------------------===//

#include "jade/vm/Runner.hpp"

#include "vm/Fault.hpp"
#include "vm/OpHandlers.hpp"
#include "vm/Step.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string_view>
#include <vector>

namespace jade::vm
{
namespace
{
uint64_t resolveMaxSteps(uint64_t configured)
{
    if (configured != 0)
        return configured;
    if (const char *env = std::getenv("JADE_MAX_STEPS"))
    {
        const std::string_view text(env);
        uint64_t n = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), n);
        if (ec == std::errc{} && ptr == text.data() + text.size() && n != 0)
            return n;
    }
    return kDefaultMaxSteps;
}

ExecutionFault mismatch(const std::string &what, const bc::Input &input, const bc::Type &param)
{
    return ExecutionFault(FaultKind::BadInput, what + " is " + input.type.toString() +
                                                   ", parameter expects " + param.toString());
}

Value bindScalar(const bc::Input &input, const bc::Type &param, const std::string &what)
{
    if (!input.type.isIntCategory() || !param.isIntCategory())
        throw mismatch(what, input, param);
    switch (input.type.kind)
    {
        case bc::Type::Kind::Boolean:
            return Value::makeInt(input.scalar != 0 ? 1 : 0);
        case bc::Type::Kind::Char:
            return Value::makeChar(static_cast<std::uint16_t>(input.scalar));
        default:
            return detail::coerceScalar(Value::makeInt(input.scalar), param);
    }
}

/// @brief Turn @p input into a local or field value, allocating arrays and
///        objects on @p heap.
/// @details Object inputs supply one value per instance field of their class,
///          in declaration order; no constructor runs.
Value materialize(const bc::Input &input,
                  const bc::Type &param,
                  const std::string &what,
                  Heap &heap,
                  InstructionStore &store)
{
    if (input.type.kind == bc::Type::Kind::Array)
    {
        if (param != input.type)
            throw mismatch(what, input, param);
        const bc::Type &element = *input.type.element;
        std::vector<Value> elements;
        elements.reserve(input.elements.size());
        for (std::int32_t e : input.elements)
            elements.push_back(detail::coerceScalar(Value::makeInt(e), element));
        return Value::makeRef(heap.allocate(Value::makeArray(element, std::move(elements))));
    }

    if (input.type.kind == bc::Type::Kind::Object)
    {
        if (param != input.type)
            throw mismatch(what, input, param);
        const std::string &className = input.type.className;
        const bc::ClassInfo &cls = store.classInfo(className);

        std::vector<const bc::FieldInfo *> declared;
        for (const auto &f : cls.fields)
        {
            if (!f.isStatic)
                declared.push_back(&f);
        }
        if (declared.size() != input.fields.size())
            throw ExecutionFault(FaultKind::BadInput,
                                 what + ": " + className + " has " +
                                     std::to_string(declared.size()) + " instance fields, got " +
                                     std::to_string(input.fields.size()) + " values");

        std::map<std::string, Value> fields;
        for (size_t i = 0; i < declared.size(); ++i)
        {
            const bc::FieldInfo &f = *declared[i];
            fields.emplace(f.name,
                           materialize(input.fields[i], f.type, what + " field " + f.name, heap,
                                       store));
        }
        return Value::makeRef(heap.allocate(Value::makeObject(className, std::move(fields))));
    }

    return bindScalar(input, param, what);
}
} // namespace

std::string RunResult::token() const
{
    if (!outcome)
        return std::string(kNonTerminationMarker);
    return std::string(toToken(*outcome));
}

ExecState buildInitialState(const bc::MethodId &method,
                            const std::vector<bc::Input> &inputs,
                            InstructionStore &store)
{
    if (inputs.size() != method.params.size())
        throw ExecutionFault(FaultKind::BadInput,
                             method.toString() + " takes " + std::to_string(method.params.size()) +
                                 " arguments, got " + std::to_string(inputs.size()));

    ExecState state;
    Frame entry = makeFrame(store.intern(method));
    for (size_t i = 0; i < inputs.size(); ++i)
    {
        entry.setLocal(static_cast<std::uint32_t>(i),
                       materialize(inputs[i], method.params[i], "argument " + std::to_string(i),
                                   state.heap, store));
    }
    state.frames.push_back(std::move(entry));
    return state;
}

class Runner::Impl
{
  public:
    Impl(const bc::ProgramSuite &suite, RunConfig config)
        : suite(suite), config(config), budget(resolveMaxSteps(config.maxSteps))
    {
    }

    RunResult run(const bc::MethodId &method, const std::vector<bc::Input> &inputs)
    {
        InstructionStore store(suite);
        ExecState state = buildInitialState(method, inputs, store);

        std::ostream &os = config.traceStream ? *config.traceStream : std::cerr;
        TraceSink sink(config.trace, os);
        TraceSink *trace = sink.enabled() ? &sink : nullptr;

        uint64_t steps = 0;
        while (steps < budget)
        {
            StepResult next = step(std::move(state), store, trace);
            ++steps;
            if (auto *halt = std::get_if<Halt>(&next))
            {
                sink.onOutcome(halt->outcome, steps);
                return RunResult{halt->outcome, steps, std::move(halt->returned)};
            }
            state = std::move(std::get<ExecState>(next));
        }
        sink.onBudgetExhausted(steps);
        return RunResult{std::nullopt, steps, std::nullopt};
    }

    const bc::ProgramSuite &suite;
    RunConfig config;
    uint64_t budget;
};

Runner::Runner(const bc::ProgramSuite &suite, RunConfig config)
    : impl(std::make_unique<Impl>(suite, config))
{
}

Runner::~Runner() = default;

Runner::Runner(Runner &&) noexcept = default;

Runner &Runner::operator=(Runner &&) noexcept = default;

RunResult Runner::run(const bc::MethodId &method, const std::vector<bc::Input> &inputs)
{
    return impl->run(method, inputs);
}

uint64_t Runner::maxSteps() const
{
    return impl->budget;
}

} // namespace jade::vm
