// File: tests/common/SuiteBuilder.cpp
// Purpose: Implement the in-memory suite builder used by unit tests.
// Key invariants: Parse failures surface as exceptions carrying the diagnostic.
// Ownership/Lifetime: See SuiteBuilder.hpp.
// Links: docs/codemap.md

#include "common/SuiteBuilder.hpp"

#include "bc/io/InstrParser.hpp"

#include <stdexcept>

namespace jade::tests
{

bc::MethodId methodId(std::string_view id)
{
    auto parsed = bc::parseMethodId(id);
    if (!parsed)
        throw std::invalid_argument(parsed.error().message);
    return parsed.value();
}

bc::Instr instr(std::string_view text)
{
    auto parsed = bc::io::parseInstruction(text, {});
    if (!parsed)
        throw std::invalid_argument(parsed.error().message);
    return parsed.value();
}

bc::FieldInfo field(std::string name, std::string_view descriptor, bool isStatic)
{
    auto ty = bc::parseTypeDescriptor(descriptor);
    if (!ty)
        throw std::invalid_argument("bad descriptor " + std::string(descriptor));
    bc::FieldInfo info;
    info.name = std::move(name);
    info.type = *ty;
    info.isStatic = isStatic;
    return info;
}

SuiteBuilder &SuiteBuilder::addClass(std::string name, std::vector<bc::FieldInfo> fields)
{
    bc::ClassInfo info;
    info.name = std::move(name);
    info.fields = std::move(fields);
    suite_.addClass(std::move(info));
    return *this;
}

bc::MethodId SuiteBuilder::method(std::string_view id, std::initializer_list<std::string_view> lines)
{
    std::vector<bc::Instr> body;
    body.reserve(lines.size());
    for (auto line : lines)
        body.push_back(instr(line));
    return method(id, std::move(body));
}

bc::MethodId SuiteBuilder::method(std::string_view id, std::vector<bc::Instr> body)
{
    bc::MethodId mid = methodId(id);
    auto added = suite_.addMethod(mid, std::move(body));
    if (!added)
        throw std::invalid_argument(added.error().message);
    return mid;
}

vm::RunResult SuiteBuilder::run(const bc::MethodId &id,
                                const std::vector<bc::Input> &inputs,
                                std::uint64_t maxSteps) const
{
    vm::RunConfig config;
    config.maxSteps = maxSteps;
    vm::Runner runner(suite_, config);
    return runner.run(id, inputs);
}

std::string SuiteBuilder::outcome(const bc::MethodId &id,
                                  const std::vector<bc::Input> &inputs,
                                  std::uint64_t maxSteps) const
{
    return run(id, inputs, maxSteps).token();
}

} // namespace jade::tests
