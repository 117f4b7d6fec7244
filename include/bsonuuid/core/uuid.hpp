/**
 * @file uuid.hpp
 * @brief The BSON UUID value type.
 *
 * A UUID owns exactly 16 bytes. It can be generated (RFC 4122 version 4),
 * parsed from a 32/36 character hex string, adopted from a 16-byte buffer,
 * rendered back to hex, compared, and exported as a BSON Binary of
 * subtype 4.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#include "bsonuuid/core/binary.hpp"
#include "bsonuuid/core/error.hpp"
#include "bsonuuid/core/export.hpp"
#include "bsonuuid/core/result.hpp"
#include "bsonuuid/utils/hex.hpp"
#include "bsonuuid/utils/random.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace bsonuuid {
namespace core {

/**
 * @struct UuidContext
 * @brief Per-instance configuration handed to a UUID at construction.
 */
struct UuidContext {
    /// Compute and keep the dashed hex string whenever the bytes are set
    bool cacheHexString = false;
    std::shared_ptr<const utils::HexCodec> hexCodec = utils::standardHexCodec();
    std::shared_ptr<utils::RandomSource> randomSource = utils::systemRandomSource();
};

class UUID;

/**
 * The four shapes a UUID can be built from.
 */
namespace input {

struct Empty {};

struct CopyOf {
    std::reference_wrapper<const UUID> source;
};

struct RawBytes {
    utils::ByteBuffer bytes;
};

struct HexText {
    std::string text;
};

}  // namespace input

using UuidInput = std::variant<input::Empty, input::CopyOf, input::RawBytes, input::HexText>;

/**
 * @class UUID
 * @brief 128-bit identifier with an optional cached canonical hex string.
 *
 * The cache, when enabled through UuidContext, always holds the dashed
 * form and always matches the current bytes.
 *
 * A single instance must not be mutated (setId, assignment) concurrently
 * with any other access to it.
 *
 * Usage:
 * @code
 * UUID fresh;
 * UUID parsed("00112233-4455-4677-8899-aabbccddeeff");
 * std::string compact = parsed.toHexString(false);
 * Binary blob = parsed.toBinary();
 * @endcode
 */
class BSONUUID_CORE_API UUID {
public:
    using Bytes = utils::UuidBytes;

    static constexpr size_t BYTE_LENGTH = utils::UUID_BYTE_LENGTH;
    static constexpr BinarySubtype SUBTYPE = BinarySubtype::UUID;

    /**
     * @brief Generate a new random (v4) UUID. Never fails.
     */
    UUID();
    explicit UUID(UuidContext context);

    /**
     * @brief Adopt 16 raw bytes.
     * @throws InvalidArgument if @p bytes is not exactly 16 bytes long.
     */
    explicit UUID(const utils::ByteBuffer& bytes, UuidContext context = UuidContext());

    explicit UUID(const Bytes& bytes, UuidContext context = UuidContext());

    /**
     * @brief Parse a 32 or 36 character hex string.
     * @throws InvalidArgument if @p hex is malformed.
     */
    explicit UUID(const std::string& hex, UuidContext context = UuidContext());

    // No move members: moves copy, so the source keeps its context and cache
    UUID(const UUID&) = default;
    UUID& operator=(const UUID&) = default;

    /**
     * @brief Build from any input shape without throwing.
     *
     * CopyOf ignores @p context and copies the source's context along
     * with its bytes and cache.
     */
    static Result<UUID, InvalidArgument> create(const UuidInput& input,
                                                const UuidContext& context = UuidContext());

    /**
     * @brief Parse @p hex to bytes, then construct from those bytes.
     * @throws InvalidArgument if @p hex is malformed.
     */
    static UUID createFromHexString(const std::string& hex, UuidContext context = UuidContext());

    /**
     * @brief 16 random bytes with the version 4 and RFC 4122 variant bits set.
     */
    static Bytes generate();
    static Bytes generate(utils::RandomSource& source);

    /// @name Validity predicates (never throw)
    /// @{
    static bool isValid(const UUID& uuid);
    static bool isValid(const std::string& hex);

    /**
     * A buffer is valid when it is 16 bytes long and the first character of
     * byte 6's unpadded hex rendering, read as a decimal digit, equals the
     * UUID binary subtype (4).
     */
    static bool isValid(const utils::ByteBuffer& bytes);
    static bool isValid(const Bytes& bytes);
    /// @}

    const Bytes& id() const { return bytes_; }

    /**
     * @brief Replace the bytes, refreshing the cached hex string with them.
     * @throws InvalidArgument if @p bytes is not exactly 16 bytes long.
     */
    void setId(const utils::ByteBuffer& bytes);
    void setId(const Bytes& bytes);

    /**
     * @brief Lower-case hex, 36 characters with dashes or 32 without.
     */
    std::string toHexString(bool includeDashes = true) const;

    std::string toString() const { return toHexString(); }
    std::string toJSON() const { return toHexString(); }

    /**
     * @brief Debug form: UUID("xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx")
     */
    std::string inspect() const;

    /// @name Equality (never throws; malformed input compares unequal)
    /// @{
    bool equals(const UUID& other) const;
    bool equals(const std::string& other) const;
    bool equals(const utils::ByteBuffer& other) const;
    bool equals(const Bytes& other) const;
    /// @}

    Binary toBinary() const;

    const UuidContext& context() const { return context_; }
    bool isHexStringCached() const { return cachedHex_.has_value(); }

    bool operator==(const UUID& other) const { return equals(other); }
    bool operator!=(const UUID& other) const { return !equals(other); }
    bool operator<(const UUID& other) const;

private:
    static Result<UUID, InvalidArgument> convert(const input::Empty&, const UuidContext& context);
    static Result<UUID, InvalidArgument> convert(const input::CopyOf& in, const UuidContext& context);
    static Result<UUID, InvalidArgument> convert(const input::RawBytes& in, const UuidContext& context);
    static Result<UUID, InvalidArgument> convert(const input::HexText& in, const UuidContext& context);

    static Result<Bytes, InvalidArgument> bytesFromBuffer(const utils::ByteBuffer& bytes);
    static Result<Bytes, InvalidArgument> bytesFromHex(const std::string& hex,
                                                       const utils::HexCodec& codec);

    void assign(const Bytes& bytes);

    Bytes bytes_;
    UuidContext context_;
    mutable std::optional<std::string> cachedHex_;
};

BSONUUID_CORE_API std::ostream& operator<<(std::ostream& os, const UUID& uuid);

/**
 * @brief Recover a UUID from a Binary of subtype UUID holding 16 bytes.
 */
BSONUUID_CORE_API Result<UUID, InvalidArgument> uuidFromBinary(const Binary& binary,
                                                               const UuidContext& context = UuidContext());

}  // namespace core
}  // namespace bsonuuid

namespace std {

template<>
struct hash<bsonuuid::core::UUID> {
    size_t operator()(const bsonuuid::core::UUID& uuid) const noexcept {
        const auto& bytes = uuid.id();
        return hash<string_view>()(
            string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    }
};

}  // namespace std
