#ifndef PLISTKIT_BINARY_PLIST_READER_HPP
#define PLISTKIT_BINARY_PLIST_READER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "plist_options.hpp"
#include "plist_value.hpp"

namespace plistkit {

/**
 * @defgroup BinaryFormat Binary Plist Decoding
 * @brief Decoder for the CoreFoundation "bplist00" format.
 * @{
 */

/**
 * @class BinaryInput
 * @brief Bounds-checked big-endian reader over an in-memory buffer.
 *
 * Every read checks the remaining length first and throws
 * MalformedPlistError naming the offending offset, so a hostile footer can
 * never cause a read outside the buffer.
 */
class BinaryInput {
   private:
    std::string_view mData;
    size_t mPos = 0;

    void require(size_t count) const;

   public:
    explicit BinaryInput(std::string_view data);

    uint8_t readByte();

    /**
     * @brief Read an unsigned big-endian integer of @p width bytes.
     *
     * Widths above 8 keep only the low 64 bits.
     */
    uint64_t readUInt(size_t width);

    float readFloat();
    double readDouble();

    /// Returns a view into the underlying buffer.
    std::string_view readBytes(size_t length);

    size_t tell() const { return mPos; }

    /// @throws MalformedPlistError if @p pos is past the end
    void seek(size_t pos);

    size_t size() const { return mData.size(); }
    size_t remaining() const { return mData.size() - mPos; }
};

/**
 * @enum PlistFormat
 * @brief Serialization chosen by sniffFormat().
 */
enum class PlistFormat { Xml, Binary };

/**
 * @struct FormatInfo
 * @brief Result of sniffing the first eight bytes of a buffer.
 */
struct FormatInfo {
    PlistFormat format = PlistFormat::Xml;
    /// False when the binary magic matched but the version is unknown.
    bool supported_version = true;
    /// Two-character version token for binary input, e.g. "00".
    std::string version;
};

/**
 * @brief Choose a decoder for @p buffer.
 *
 * Buffers without the "bplist" magic, including those shorter than the
 * header, are XML. An unknown version still selects the binary decoder so
 * that BinaryPlistVersionError is raised when decoding is attempted.
 */
FormatInfo sniffFormat(std::string_view buffer);

/**
 * @struct BinaryTrailer
 * @brief The fixed 32-byte footer of a binary plist.
 */
struct BinaryTrailer {
    uint8_t sort_version = 0;
    uint8_t offset_int_size = 0;
    uint8_t object_ref_size = 0;
    uint64_t num_objects = 0;
    uint64_t top_object = 0;
    uint64_t offset_table_offset = 0;
};

/**
 * @class BinaryPlistReader
 * @brief Decodes a binary plist buffer into a Value tree.
 *
 * The layout consists of:
 * - An 8-byte header: "bplist" followed by a 2-byte version ("00")
 * - Objects, each starting with a marker byte: type tag (high nibble) and
 *   a short argument (low nibble)
 * - An offset table mapping object numbers to byte offsets
 * - A 32-byte trailer describing the table
 *
 * Objects are decoded on demand starting from the top object. Each one is
 * decoded at most once. References are counted before decoding, so a cached
 * Value is moved into its last referrer and only genuinely shared objects
 * are copied. Those copies are charged against
 * PlistOptions::max_expanded_bytes.
 *
 * @code
 * std::string bytes = read_file("Info.plist");
 * plistkit::BinaryPlistReader reader(bytes);
 * plistkit::Value root = reader.parse();
 * @endcode
 *
 * @note The reader keeps a view of @p data; the buffer must outlive parse().
 */
class BinaryPlistReader {
   public:
    static const char MAGIC[6];
    static const char VERSION_00[2];
    static const size_t HEADER_SIZE = 8;
    static const size_t TRAILER_SIZE = 32;

    /// Argument nibble meaning "the real count follows as an int object".
    static const uint8_t COUNT_INT_FOLLOWS = 0x0F;

    // Object type tags (high nibble of the marker byte)
    static const uint8_t TYPE_SIMPLE = 0x0;   ///< null, false, true, fill
    static const uint8_t TYPE_INT = 0x1;      ///< 2^arg byte integer
    static const uint8_t TYPE_REAL = 0x2;     ///< 2^arg byte IEEE float
    static const uint8_t TYPE_DATE = 0x3;     ///< 8-byte double since 2001
    static const uint8_t TYPE_DATA = 0x4;     ///< byte blob
    static const uint8_t TYPE_ASCII = 0x5;    ///< ASCII string
    static const uint8_t TYPE_UNICODE = 0x6;  ///< UTF-16BE string
    static const uint8_t TYPE_UID = 0x8;      ///< 2^arg byte uid
    static const uint8_t TYPE_ARRAY = 0xA;
    static const uint8_t TYPE_SET = 0xC;
    static const uint8_t TYPE_DICT = 0xD;

    // Simple values (low nibble with TYPE_SIMPLE)
    static const uint8_t SIMPLE_NULL = 0x0;
    static const uint8_t SIMPLE_FALSE = 0x8;
    static const uint8_t SIMPLE_TRUE = 0x9;
    static const uint8_t SIMPLE_FILL = 0xF;

    /// Seconds between the Unix epoch and 2001-01-01T00:00:00Z.
    static const int64_t EPOCH_2001 = 978307200;

    explicit BinaryPlistReader(std::string_view data, const PlistOptions& options = {});

    /**
     * @brief Decode the whole document.
     *
     * @return The top object
     * @throws BinaryPlistVersionError if the version is not "00"
     * @throws BinaryPlistHeaderError if the magic is missing
     * @throws MalformedPlistError if any structure is truncated or invalid
     */
    Value parse();

    const BinaryTrailer& trailer() const { return mTrailer; }

    /// Number of objects actually decoded by the last parse().
    size_t objectsDecoded() const { return mDecodeCount; }

    /// Approximate bytes spent copying shared objects in the last parse().
    uint64_t bytesExpanded() const { return mExpandedBytes; }

   private:
    enum class ObjectState : uint8_t { Pending, Loading, Loaded, Taken };

    BinaryInput mIn;
    PlistOptions mOptions;
    BinaryTrailer mTrailer;
    std::vector<uint64_t> mOffsets;
    std::vector<Value> mObjects;
    std::vector<ObjectState> mStates;
    std::vector<uint64_t> mRefsLeft;
    std::vector<uint64_t> mWeights;
    size_t mDecodeCount = 0;
    size_t mDepth = 0;
    uint64_t mExpandedBytes = 0;

    void loadHeader();
    void loadTrailer();
    void loadOffsetTable();
    void countReferences();

    const Value& loadObject(uint64_t objectNo);
    Value takeObject(uint64_t objectNo, uint64_t& weight);
    Value decodeObject(size_t offset, uint64_t& weight);

    uint64_t readCount(uint8_t objarg);
    std::vector<uint64_t> readRefs(uint64_t count);
    void checkFits(uint64_t count, uint64_t width, size_t offset) const;

    Value loadSimple(uint8_t objarg, size_t offset);
    Value loadInt(uint8_t objarg, size_t offset);
    Value loadReal(uint8_t objarg, size_t offset);
    Value loadDate(uint8_t objarg, size_t offset);
    Value loadData(uint8_t objarg);
    Value loadAscii(uint8_t objarg);
    Value loadUnicode(uint8_t objarg);
    Value loadUid(uint8_t objarg, size_t offset);
    Value loadArray(uint8_t objarg, uint64_t& weight);
    Value loadSet(uint8_t objarg, uint64_t& weight);
    Value loadDict(uint8_t objarg, size_t offset, uint64_t& weight);

    void throwExpanded(size_t offset) const;

    void warn(const std::string& category, const std::string& message) const;
};

/** @} */

}  // namespace plistkit

#endif  // PLISTKIT_BINARY_PLIST_READER_HPP
