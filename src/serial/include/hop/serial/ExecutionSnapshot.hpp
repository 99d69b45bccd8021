// /////////////////////////////////////////////////////////////////////////////
/// @file ExecutionSnapshot.hpp
/// @brief Complete execution state captured at a migration point
///        (Memento pattern).
///
/// Holds the opaque unwound stack, the module globals, linear memory and
/// the migration call chain.  A snapshot is produced once by the capturer,
/// moved through the delta engine and the transport, and consumed exactly
/// once by the restorer.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <hop/serial/ISerializable.hpp>
#include <hop/serial/MemoryImage.hpp>
#include <hop/core/Types.hpp>

#include <bit>
#include <string_view>
#include <vector>

namespace hop::serial {

/// @brief Type tag of a module global.
enum class ValueType : core::u8
{
    I32 = 0,
    I64 = 1,
    F32 = 2,
    F64 = 3
};

[[nodiscard]] std::string_view toString(ValueType type) noexcept;

/// @brief A typed global value stored as its raw 64-bit pattern.
struct GlobalValue
{
    ValueType type{ValueType::I32};
    core::u64 bits{0};

    [[nodiscard]] static GlobalValue i32(core::i32 v) noexcept
    {
        return {ValueType::I32, static_cast<core::u32>(v)};
    }
    [[nodiscard]] static GlobalValue i64(core::i64 v) noexcept
    {
        return {ValueType::I64, static_cast<core::u64>(v)};
    }
    [[nodiscard]] static GlobalValue f32(core::f32 v) noexcept
    {
        return {ValueType::F32, std::bit_cast<core::u32>(v)};
    }
    [[nodiscard]] static GlobalValue f64(core::f64 v) noexcept
    {
        return {ValueType::F64, std::bit_cast<core::u64>(v)};
    }

    [[nodiscard]] core::i32 asI32() const noexcept { return static_cast<core::i32>(static_cast<core::u32>(bits)); }
    [[nodiscard]] core::i64 asI64() const noexcept { return static_cast<core::i64>(bits); }
    [[nodiscard]] core::f32 asF32() const noexcept { return std::bit_cast<core::f32>(static_cast<core::u32>(bits)); }
    [[nodiscard]] core::f64 asF64() const noexcept { return std::bit_cast<core::f64>(bits); }

    [[nodiscard]] bool operator==(const GlobalValue &) const = default;
};

/// @brief One entry of the migration call chain.
///
/// Pushed when a function placed on another node is entered; the frame
/// records the caller's node and stack height so the matching function exit
/// migrates back to it.
struct CallFrame
{
    core::NodeId fromNode;
    core::u32    stackHeight{0};

    [[nodiscard]] bool operator==(const CallFrame &) const = default;
};

/// @brief Full execution state at a migration point.
class ExecutionSnapshot final : public ISerializable
{
public:
    ExecutionSnapshot();
    ExecutionSnapshot(core::Bytes stackState,
                      std::vector<GlobalValue> globals,
                      MemoryImage memory,
                      std::vector<CallFrame> callChain = {});
    ~ExecutionSnapshot() override;

    ExecutionSnapshot(const ExecutionSnapshot&) = delete;
    ExecutionSnapshot& operator=(const ExecutionSnapshot&) = delete;
    ExecutionSnapshot(ExecutionSnapshot&&) noexcept;
    ExecutionSnapshot& operator=(ExecutionSnapshot&&) noexcept;

    [[nodiscard]] const core::Bytes              &stackState() const noexcept { return stackState_; }
    [[nodiscard]] const std::vector<GlobalValue> &globals()    const noexcept { return globals_; }
    [[nodiscard]] const MemoryImage              &memory()     const noexcept { return memory_; }
    [[nodiscard]] const std::vector<CallFrame>   &callChain()  const noexcept { return callChain_; }

    /// @brief Replaces the memory payload, consuming this snapshot.
    [[nodiscard]] ExecutionSnapshot withMemory(MemoryImage memory) &&;

    /// @brief Replaces the call chain, consuming this snapshot.
    [[nodiscard]] ExecutionSnapshot withCallChain(std::vector<CallFrame> callChain) &&;

    /// @brief Releases the memory payload for reconstruction.
    [[nodiscard]] MemoryImage takeMemory() noexcept;

    /// @brief FNV-1a digest of stack, globals, memory payload and chain.
    [[nodiscard]] core::u64 hash() const noexcept;

    // ISerializable ──────────────────────────────────────────────────────────
    [[nodiscard]] core::Expected<void> serialize(ByteStream& stream) const override;
    [[nodiscard]] core::Expected<void> deserialize(ByteStream& stream) override;
    [[nodiscard]] core::usize serializedSize() const noexcept override;

private:
    core::Bytes              stackState_;
    std::vector<GlobalValue> globals_;
    MemoryImage              memory_;
    std::vector<CallFrame>   callChain_;
};

} // namespace hop::serial
