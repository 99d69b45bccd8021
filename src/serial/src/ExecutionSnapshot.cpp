// /////////////////////////////////////////////////////////////////////////////
/// @file ExecutionSnapshot.cpp
/// @brief ExecutionSnapshot implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/serial/ExecutionSnapshot.hpp>
#include <hop/serial/ByteStream.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/StateHash.hpp>

#include <format>
#include <utility>

namespace hop::serial {

namespace {

constexpr core::u32 kMaxGlobals        = 1u << 20;
constexpr core::u32 kMaxCallChainDepth = 4096;

} // namespace

std::string_view toString(ValueType type) noexcept
{
    switch (type)
    {
    case ValueType::I32: return "i32";
    case ValueType::I64: return "i64";
    case ValueType::F32: return "f32";
    case ValueType::F64: return "f64";
    }
    return "?";
}

ExecutionSnapshot::ExecutionSnapshot() = default;

ExecutionSnapshot::ExecutionSnapshot(core::Bytes stackState,
                                     std::vector<GlobalValue> globals,
                                     MemoryImage memory,
                                     std::vector<CallFrame> callChain)
    : stackState_{std::move(stackState)}
    , globals_{std::move(globals)}
    , memory_{std::move(memory)}
    , callChain_{std::move(callChain)}
{}

ExecutionSnapshot::~ExecutionSnapshot() = default;
ExecutionSnapshot::ExecutionSnapshot(ExecutionSnapshot&&) noexcept = default;
ExecutionSnapshot& ExecutionSnapshot::operator=(ExecutionSnapshot&&) noexcept = default;

ExecutionSnapshot ExecutionSnapshot::withMemory(MemoryImage memory) &&
{
    return ExecutionSnapshot{std::move(stackState_), std::move(globals_),
                             std::move(memory), std::move(callChain_)};
}

ExecutionSnapshot ExecutionSnapshot::withCallChain(std::vector<CallFrame> callChain) &&
{
    return ExecutionSnapshot{std::move(stackState_), std::move(globals_),
                             std::move(memory_), std::move(callChain)};
}

MemoryImage ExecutionSnapshot::takeMemory() noexcept
{
    return std::exchange(memory_, MemoryImage{});
}

core::u64 ExecutionSnapshot::hash() const noexcept
{
    core::StateHash hasher;
    hasher.hashBytes(stackState_);
    for (const auto &g : globals_)
    {
        hasher.combine(static_cast<core::u8>(g.type)).combine(g.bits);
    }
    hasher.combine(static_cast<core::u8>(memory_.kind())).combine(memory_.pages());
    hasher.hashBytes(memory_.blob());
    for (const auto &p : memory_.patches())
    {
        hasher.combine(p.index).hashBytes(p.data);
    }
    for (const auto &f : callChain_)
    {
        hasher.hashBytes({reinterpret_cast<const core::byte*>(f.fromNode.data()), f.fromNode.size()});
        hasher.combine(f.stackHeight);
    }
    return hasher.digest();
}

core::Expected<void> ExecutionSnapshot::serialize(ByteStream& stream) const
{
    stream.writeBlob(stackState_);

    stream.writeU32(static_cast<core::u32>(globals_.size()));
    for (const auto &g : globals_)
    {
        stream.writeU8(static_cast<core::u8>(g.type));
        stream.writeU64(g.bits);
    }

    stream.writeU32(static_cast<core::u32>(callChain_.size()));
    for (const auto &f : callChain_)
    {
        stream.writeString(f.fromNode);
        stream.writeU32(f.stackHeight);
    }

    return memory_.serialize(stream);
}

core::usize ExecutionSnapshot::serializedSize() const noexcept
{
    core::usize size = 4 + stackState_.size();
    size += 4 + globals_.size() * (1 + 8);
    size += 4;
    for (const auto &f : callChain_)
    {
        size += 4 + f.fromNode.size() + 4;
    }
    return size + memory_.serializedSize();
}

core::Expected<void> ExecutionSnapshot::deserialize(ByteStream& stream)
{
    stackState_ = HOP_TRY(stream.readBlob(core::kMaxMessageSize));

    const auto globalCount = HOP_TRY(stream.readU32());
    if (globalCount > kMaxGlobals)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("{} globals exceeds limit", globalCount));
    }
    globals_.clear();
    globals_.reserve(globalCount);
    for (core::u32 i = 0; i < globalCount; ++i)
    {
        const auto type = HOP_TRY(stream.readU8());
        if (type > static_cast<core::u8>(ValueType::F64))
        {
            return core::makeError(core::ErrorCode::kDeserializationFailed,
                                   std::format("unknown global type tag {}", type));
        }
        const auto bits = HOP_TRY(stream.readU64());
        globals_.push_back(GlobalValue{static_cast<ValueType>(type), bits});
    }

    const auto depth = HOP_TRY(stream.readU32());
    if (depth > kMaxCallChainDepth)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("call chain depth {} exceeds limit", depth));
    }
    callChain_.clear();
    callChain_.reserve(depth);
    for (core::u32 i = 0; i < depth; ++i)
    {
        CallFrame f;
        f.fromNode    = HOP_TRY(stream.readString());
        f.stackHeight = HOP_TRY(stream.readU32());
        callChain_.push_back(std::move(f));
    }

    return memory_.deserialize(stream);
}

} // namespace hop::serial
