/**
 * @file uuid.cpp
 * @brief UUID implementation.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#include "bsonuuid/core/uuid.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace bsonuuid {
namespace core {

namespace {

const char* const kConstructorError =
    "Argument passed in UUID constructor must be a UUID, a 16 byte Buffer or a "
    "32/36 character hex string (dashes excluded/included, format: "
    "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx).";

std::string stripDashes(const std::string& hex) {
    std::string out;
    out.reserve(utils::UUID_HEX_LENGTH);
    for (char c : hex) {
        if (c != '-') out.push_back(c);
    }
    return out;
}

// Temporaries built for comparison must not touch the hex cache
UuidContext comparisonContext(const UuidContext& context) {
    UuidContext copy = context;
    copy.cacheHexString = false;
    return copy;
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

UUID::UUID() : UUID(UuidContext()) {}

UUID::UUID(UuidContext context)
    : bytes_{}
    , context_(std::move(context))
{
    assign(generate(*context_.randomSource));
}

UUID::UUID(const utils::ByteBuffer& bytes, UuidContext context)
    : bytes_{}
    , context_(std::move(context))
{
    auto parsed = bytesFromBuffer(bytes);
    if (parsed.is_err()) {
        throw parsed.error();
    }
    assign(parsed.value());
}

UUID::UUID(const Bytes& bytes, UuidContext context)
    : bytes_{}
    , context_(std::move(context))
{
    assign(bytes);
}

UUID::UUID(const std::string& hex, UuidContext context)
    : bytes_{}
    , context_(std::move(context))
{
    auto parsed = bytesFromHex(hex, *context_.hexCodec);
    if (parsed.is_err()) {
        throw parsed.error();
    }
    assign(parsed.value());
}

Result<UUID, InvalidArgument> UUID::create(const UuidInput& input, const UuidContext& context) {
    return std::visit([&context](const auto& alternative) {
        return convert(alternative, context);
    }, input);
}

Result<UUID, InvalidArgument> UUID::convert(const input::Empty&, const UuidContext& context) {
    return Result<UUID, InvalidArgument>::ok(UUID(context));
}

Result<UUID, InvalidArgument> UUID::convert(const input::CopyOf& in, const UuidContext&) {
    return Result<UUID, InvalidArgument>::ok(UUID(in.source.get()));
}

Result<UUID, InvalidArgument> UUID::convert(const input::RawBytes& in, const UuidContext& context) {
    auto parsed = bytesFromBuffer(in.bytes);
    if (parsed.is_err()) {
        return Result<UUID, InvalidArgument>::err(parsed.error());
    }
    return Result<UUID, InvalidArgument>::ok(UUID(parsed.value(), context));
}

Result<UUID, InvalidArgument> UUID::convert(const input::HexText& in, const UuidContext& context) {
    auto parsed = bytesFromHex(in.text, *context.hexCodec);
    if (parsed.is_err()) {
        return Result<UUID, InvalidArgument>::err(parsed.error());
    }
    return Result<UUID, InvalidArgument>::ok(UUID(parsed.value(), context));
}

Result<UUID::Bytes, InvalidArgument> UUID::bytesFromBuffer(const utils::ByteBuffer& bytes) {
    if (bytes.size() != BYTE_LENGTH) {
        return Result<Bytes, InvalidArgument>::err(InvalidArgument(kConstructorError));
    }
    Bytes out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return Result<Bytes, InvalidArgument>::ok(out);
}

Result<UUID::Bytes, InvalidArgument> UUID::bytesFromHex(const std::string& hex,
                                                        const utils::HexCodec& codec) {
    if (!codec.validateHexString(hex)) {
        return Result<Bytes, InvalidArgument>::err(InvalidArgument(kConstructorError));
    }
    try {
        return Result<Bytes, InvalidArgument>::ok(codec.hexToBytes(hex));
    } catch (const std::invalid_argument& e) {
        return Result<Bytes, InvalidArgument>::err(InvalidArgument(e.what()));
    }
}

UUID UUID::createFromHexString(const std::string& hex, UuidContext context) {
    auto parsed = bytesFromHex(hex, *context.hexCodec);
    if (parsed.is_err()) {
        throw parsed.error();
    }
    const Bytes& raw = parsed.value();
    return UUID(utils::ByteBuffer(raw.begin(), raw.end()), std::move(context));
}

// =============================================================================
// Generation & Validation
// =============================================================================

UUID::Bytes UUID::generate() {
    return generate(*utils::systemRandomSource());
}

UUID::Bytes UUID::generate(utils::RandomSource& source) {
    std::vector<uint8_t> random = source.randomBytes(BYTE_LENGTH);
    if (random.size() != BYTE_LENGTH) {
        throw std::length_error("random source returned " + std::to_string(random.size()) +
                                " bytes, expected 16");
    }

    Bytes bytes{};
    std::copy(random.begin(), random.end(), bytes.begin());

    // Version 4 in the high nibble of time_hi_and_version
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    // RFC 4122 variant (10xx) in clock_seq_hi_and_reserved
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    return bytes;
}

bool UUID::isValid(const UUID&) {
    return true;
}

bool UUID::isValid(const std::string& hex) {
    if (hex.empty()) {
        return false;
    }
    return utils::standardHexCodec()->validateHexString(hex);
}

bool UUID::isValid(const utils::ByteBuffer& bytes) {
    if (bytes.size() != BYTE_LENGTH) {
        return false;
    }
    Bytes fixed{};
    std::copy(bytes.begin(), bytes.end(), fixed.begin());
    return isValid(fixed);
}

bool UUID::isValid(const Bytes& bytes) {
    // Leading digit of byte 6 printed in hex without zero padding: the high
    // nibble, or the whole byte when it is below 0x10. Letters never match.
    unsigned leading = bytes[6] >= 0x10 ? (bytes[6] >> 4) : bytes[6];
    return leading == static_cast<unsigned>(SUBTYPE);
}

// =============================================================================
// Accessors
// =============================================================================

void UUID::setId(const utils::ByteBuffer& bytes) {
    auto parsed = bytesFromBuffer(bytes);
    if (parsed.is_err()) {
        throw parsed.error();
    }
    assign(parsed.value());
}

void UUID::setId(const Bytes& bytes) {
    assign(bytes);
}

void UUID::assign(const Bytes& bytes) {
    if (context_.cacheHexString) {
        std::string hex = context_.hexCodec->bytesToHex(bytes, true);
        bytes_ = bytes;
        cachedHex_ = std::move(hex);
    } else {
        bytes_ = bytes;
        cachedHex_.reset();
    }
}

std::string UUID::toHexString(bool includeDashes) const {
    if (!context_.cacheHexString) {
        return context_.hexCodec->bytesToHex(bytes_, includeDashes);
    }

    if (!cachedHex_) {
        cachedHex_ = context_.hexCodec->bytesToHex(bytes_, true);
    }
    return includeDashes ? *cachedHex_ : stripDashes(*cachedHex_);
}

std::string UUID::inspect() const {
    return "UUID(\"" + toHexString() + "\")";
}

// =============================================================================
// Comparison & Conversion
// =============================================================================

bool UUID::equals(const UUID& other) const {
    return utils::byteArraysEqual(bytes_, other.bytes_);
}

bool UUID::equals(const std::string& other) const {
    if (other.empty()) {
        return false;
    }
    auto parsed = create(input::HexText{other}, comparisonContext(context_));
    return parsed.is_ok() && equals(parsed.value());
}

bool UUID::equals(const utils::ByteBuffer& other) const {
    if (other.empty()) {
        return false;
    }
    auto parsed = create(input::RawBytes{other}, comparisonContext(context_));
    return parsed.is_ok() && equals(parsed.value());
}

bool UUID::equals(const Bytes& other) const {
    return utils::byteArraysEqual(bytes_, other);
}

bool UUID::operator<(const UUID& other) const {
    return std::lexicographical_compare(bytes_.begin(), bytes_.end(),
                                        other.bytes_.begin(), other.bytes_.end());
}

Binary UUID::toBinary() const {
    return Binary(std::vector<uint8_t>(bytes_.begin(), bytes_.end()), SUBTYPE);
}

std::ostream& operator<<(std::ostream& os, const UUID& uuid) {
    return os << uuid.toHexString();
}

Result<UUID, InvalidArgument> uuidFromBinary(const Binary& binary, const UuidContext& context) {
    if (binary.subType() != UUID::SUBTYPE) {
        return Result<UUID, InvalidArgument>::err(InvalidArgument(
            std::string("Binary subtype must be uuid to convert to UUID, got ") +
            binarySubtypeToString(binary.subType())));
    }
    return UUID::create(input::RawBytes{binary.buffer()}, context);
}

}  // namespace core
}  // namespace bsonuuid
