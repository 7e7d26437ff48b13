#include "binary_plist_reader.hpp"

#include <cmath>
#include <cstring>
#include <utility>

#include "plist_error.hpp"
#include "plist_util.hpp"

namespace plistkit {

namespace {

// Approximate in-memory size of a decoded scalar.
uint64_t scalar_weight(const Value &value) {
  uint64_t weight = sizeof(Value);
  if (value.isString()) {
    weight += value.asString().size();
  } else if (value.isData()) {
    weight += value.asData().size();
  }
  return weight;
}

} // namespace

// ============================================================================
// BINARY INPUT
// ============================================================================

BinaryInput::BinaryInput(std::string_view data) : mData(data) {}

void BinaryInput::require(size_t count) const {
  if (count > mData.size() - mPos) {
    throw MalformedPlistError("Binary struct problem offset " +
                              std::to_string(mPos) + ": need " +
                              std::to_string(count) + " bytes, " +
                              std::to_string(mData.size() - mPos) + " left");
  }
}

uint8_t BinaryInput::readByte() {
  require(1);
  return static_cast<uint8_t>(mData[mPos++]);
}

uint64_t BinaryInput::readUInt(size_t width) {
  require(width);
  uint64_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value = (value << 8) | static_cast<uint8_t>(mData[mPos++]);
  }
  return value;
}

float BinaryInput::readFloat() {
  uint32_t int_value = static_cast<uint32_t>(readUInt(4));
  float result;
  std::memcpy(&result, &int_value, sizeof(float));
  return result;
}

double BinaryInput::readDouble() {
  uint64_t int_value = readUInt(8);
  double result;
  std::memcpy(&result, &int_value, sizeof(double));
  return result;
}

std::string_view BinaryInput::readBytes(size_t length) {
  require(length);
  std::string_view bytes = mData.substr(mPos, length);
  mPos += length;
  return bytes;
}

void BinaryInput::seek(size_t pos) {
  if (pos > mData.size()) {
    throw MalformedPlistError("Binary struct problem offset " +
                              std::to_string(pos) + ": past end of buffer");
  }
  mPos = pos;
}

// ============================================================================
// FORMAT SNIFFING
// ============================================================================

const char BinaryPlistReader::MAGIC[6] = {'b', 'p', 'l', 'i', 's', 't'};
const char BinaryPlistReader::VERSION_00[2] = {'0', '0'};

FormatInfo sniffFormat(std::string_view buffer) {
  FormatInfo info;
  if (buffer.size() < BinaryPlistReader::HEADER_SIZE ||
      buffer.compare(0, 6, std::string_view(BinaryPlistReader::MAGIC, 6)) !=
          0) {
    return info;
  }
  info.format = PlistFormat::Binary;
  info.version = std::string(buffer.substr(6, 2));
  info.supported_version =
      info.version == std::string_view(BinaryPlistReader::VERSION_00, 2);
  return info;
}

// ============================================================================
// READER
// ============================================================================

BinaryPlistReader::BinaryPlistReader(std::string_view data,
                                     const PlistOptions &options)
    : mIn(data), mOptions(options) {}

void BinaryPlistReader::warn(const std::string &category,
                             const std::string &message) const {
  if (mOptions.warning_callback) {
    mOptions.warning_callback(category, message);
  }
}

Value BinaryPlistReader::parse() {
  mOffsets.clear();
  mObjects.clear();
  mStates.clear();
  mRefsLeft.clear();
  mWeights.clear();
  mDecodeCount = 0;
  mDepth = 0;
  mExpandedBytes = 0;

  loadHeader();
  loadTrailer();
  loadOffsetTable();
  countReferences();

  mObjects.resize(mTrailer.num_objects);
  mStates.assign(mTrailer.num_objects, ObjectState::Pending);
  mWeights.assign(mTrailer.num_objects, 0);

  loadObject(mTrailer.top_object);
  return std::move(mObjects[mTrailer.top_object]);
}

void BinaryPlistReader::loadHeader() {
  if (mIn.size() < HEADER_SIZE) {
    throw MalformedPlistError("Header: buffer of " +
                              std::to_string(mIn.size()) +
                              " bytes is too short");
  }
  mIn.seek(0);
  std::string_view magic = mIn.readBytes(6);
  std::string_view version = mIn.readBytes(2);

  if (magic != std::string_view(MAGIC, 6)) {
    throw BinaryPlistHeaderError("Not a plist, wrong magic: " +
                                 std::string(magic));
  }
  if (version != std::string_view(VERSION_00, 2)) {
    throw BinaryPlistVersionError("Unknown plist version: " +
                                  std::string(version));
  }
}

void BinaryPlistReader::loadTrailer() {
  if (mIn.size() < HEADER_SIZE + TRAILER_SIZE) {
    throw MalformedPlistError("Footer: buffer of " +
                              std::to_string(mIn.size()) +
                              " bytes cannot hold a trailer");
  }
  mIn.seek(mIn.size() - TRAILER_SIZE);
  mIn.readBytes(5);
  mTrailer.sort_version = mIn.readByte();
  mTrailer.offset_int_size = mIn.readByte();
  mTrailer.object_ref_size = mIn.readByte();
  mTrailer.num_objects = mIn.readUInt(8);
  mTrailer.top_object = mIn.readUInt(8);
  mTrailer.offset_table_offset = mIn.readUInt(8);

  auto valid_width = [](uint8_t w) {
    return w == 1 || w == 2 || w == 4 || w == 8;
  };
  if (!valid_width(mTrailer.offset_int_size)) {
    throw MalformedPlistError("Footer: invalid offset size " +
                              std::to_string(mTrailer.offset_int_size));
  }
  if (!valid_width(mTrailer.object_ref_size)) {
    throw MalformedPlistError("Footer: invalid object reference size " +
                              std::to_string(mTrailer.object_ref_size));
  }
  if (mTrailer.num_objects == 0) {
    throw MalformedPlistError("Footer: document has no objects");
  }
  if (mTrailer.top_object >= mTrailer.num_objects) {
    throw MalformedPlistError("Footer: top object " +
                              std::to_string(mTrailer.top_object) +
                              " out of range");
  }
}

void BinaryPlistReader::loadOffsetTable() {
  const uint64_t table_end = mIn.size() - TRAILER_SIZE;
  const uint64_t table_offset = mTrailer.offset_table_offset;
  if (table_offset < HEADER_SIZE || table_offset > table_end ||
      mTrailer.num_objects >
          (table_end - table_offset) / mTrailer.offset_int_size) {
    throw MalformedPlistError("Offset table: " +
                              std::to_string(mTrailer.num_objects) +
                              " entries at offset " +
                              std::to_string(table_offset) +
                              " do not fit the buffer");
  }

  mIn.seek(static_cast<size_t>(table_offset));
  mOffsets.reserve(mTrailer.num_objects);
  for (uint64_t i = 0; i < mTrailer.num_objects; ++i) {
    uint64_t offset = mIn.readUInt(mTrailer.offset_int_size);
    if (offset < HEADER_SIZE || offset >= table_end) {
      throw MalformedPlistError("Offset table: object " + std::to_string(i) +
                                " has invalid offset " +
                                std::to_string(offset));
    }
    mOffsets.push_back(offset);
  }
}

// Walks the containers reachable from the top object and counts how often
// each object is referenced. Every reference fills one slot of the decoded
// tree and at most num_objects slots are filled by moves, so the remaining
// slots must be copies the budget can pay for.
void BinaryPlistReader::countReferences() {
  const uint64_t num_objects = mTrailer.num_objects;
  const uint64_t max_refs =
      num_objects + mOptions.max_expanded_bytes / sizeof(Value);
  mRefsLeft.assign(num_objects, 0);

  std::vector<bool> seen(num_objects, false);
  std::vector<uint64_t> pending{mTrailer.top_object};
  seen[mTrailer.top_object] = true;
  uint64_t total = 0;

  while (!pending.empty()) {
    uint64_t objectNo = pending.back();
    pending.pop_back();
    size_t offset = static_cast<size_t>(mOffsets[objectNo]);
    mIn.seek(offset);
    uint8_t marker = mIn.readByte();
    uint8_t objtype = marker >> 4;
    if (objtype != TYPE_ARRAY && objtype != TYPE_SET && objtype != TYPE_DICT) {
      continue;
    }

    uint64_t count = readCount(marker & 0x0F);
    if (objtype == TYPE_DICT) {
      checkFits(count, uint64_t{2} * mTrailer.object_ref_size, mIn.tell());
      count *= 2;
    } else {
      checkFits(count, mTrailer.object_ref_size, mIn.tell());
    }
    if (count > max_refs - total) {
      throwExpanded(offset);
    }
    total += count;

    for (uint64_t i = 0; i < count; ++i) {
      uint64_t ref = mIn.readUInt(mTrailer.object_ref_size);
      if (ref >= num_objects) {
        throw MalformedPlistError("Object reference " + std::to_string(ref) +
                                  " out of range");
      }
      ++mRefsLeft[ref];
      if (!seen[ref]) {
        seen[ref] = true;
        pending.push_back(ref);
      }
    }
  }
}

void BinaryPlistReader::throwExpanded(size_t offset) const {
  throw MalformedPlistError("Shared objects near offset " +
                            std::to_string(offset) + " expand past " +
                            std::to_string(mOptions.max_expanded_bytes) +
                            " bytes");
}

const Value &BinaryPlistReader::loadObject(uint64_t objectNo) {
  if (objectNo >= mTrailer.num_objects) {
    throw MalformedPlistError("Object reference " + std::to_string(objectNo) +
                              " out of range");
  }
  switch (mStates[objectNo]) {
  case ObjectState::Loaded:
    return mObjects[objectNo];
  case ObjectState::Loading:
    throw MalformedPlistError("Object " + std::to_string(objectNo) +
                              " at offset " +
                              std::to_string(mOffsets[objectNo]) +
                              " references itself");
  case ObjectState::Taken:
    throw MalformedPlistError("Object " + std::to_string(objectNo) +
                              " at offset " +
                              std::to_string(mOffsets[objectNo]) +
                              " referenced after its last use");
  case ObjectState::Pending:
    break;
  }

  if (++mDepth > mOptions.max_depth) {
    throw MalformedPlistError("Nesting deeper than " +
                              std::to_string(mOptions.max_depth) +
                              " at offset " +
                              std::to_string(mOffsets[objectNo]));
  }
  mStates[objectNo] = ObjectState::Loading;
  uint64_t weight = 0;
  Value value = decodeObject(static_cast<size_t>(mOffsets[objectNo]), weight);
  mWeights[objectNo] = weight != 0 ? weight : scalar_weight(value);
  mObjects[objectNo] = std::move(value);
  mStates[objectNo] = ObjectState::Loaded;
  ++mDecodeCount;
  --mDepth;
  return mObjects[objectNo];
}

// The last referrer receives the cached value itself; earlier ones get a copy
// charged against max_expanded_bytes.
Value BinaryPlistReader::takeObject(uint64_t objectNo, uint64_t &weight) {
  loadObject(objectNo);
  weight += mWeights[objectNo];
  if (mRefsLeft[objectNo] > 1) {
    --mRefsLeft[objectNo];
    mExpandedBytes += mWeights[objectNo];
    if (mExpandedBytes > mOptions.max_expanded_bytes) {
      throwExpanded(static_cast<size_t>(mOffsets[objectNo]));
    }
    return mObjects[objectNo];
  }
  mRefsLeft[objectNo] = 0;
  mStates[objectNo] = ObjectState::Taken;
  return std::move(mObjects[objectNo]);
}

Value BinaryPlistReader::decodeObject(size_t offset, uint64_t &weight) {
  mIn.seek(offset);
  uint8_t marker = mIn.readByte();
  uint8_t objtype = marker >> 4;
  uint8_t objarg = marker & 0x0F;

  switch (objtype) {
  case TYPE_SIMPLE:
    return loadSimple(objarg, offset);
  case TYPE_INT:
    return loadInt(objarg, offset);
  case TYPE_REAL:
    return loadReal(objarg, offset);
  case TYPE_DATE:
    return loadDate(objarg, offset);
  case TYPE_DATA:
    return loadData(objarg);
  case TYPE_ASCII:
    return loadAscii(objarg);
  case TYPE_UNICODE:
    return loadUnicode(objarg);
  case TYPE_UID:
    return loadUid(objarg, offset);
  case TYPE_ARRAY:
    return loadArray(objarg, weight);
  case TYPE_SET:
    return loadSet(objarg, weight);
  case TYPE_DICT:
    return loadDict(objarg, offset, weight);
  default:
    throw MalformedPlistError("Unknown binary objtype " +
                              std::to_string(objtype) + " at offset " +
                              std::to_string(offset));
  }
}

uint64_t BinaryPlistReader::readCount(uint8_t objarg) {
  if (objarg != COUNT_INT_FOLLOWS) {
    return objarg;
  }
  size_t pos = mIn.tell();
  uint8_t exponent = mIn.readByte() & 0x0F;
  if (exponent > 3) {
    throw MalformedPlistError("Count at offset " + std::to_string(pos) +
                              " is " + std::to_string(1u << exponent) +
                              " bytes wide");
  }
  return mIn.readUInt(size_t{1} << exponent);
}

void BinaryPlistReader::checkFits(uint64_t count, uint64_t width,
                                  size_t offset) const {
  if (width != 0 && count > mIn.remaining() / width) {
    throw MalformedPlistError("Binary struct problem offset " +
                              std::to_string(offset) + ": count " +
                              std::to_string(count) +
                              " exceeds the buffer");
  }
}

std::vector<uint64_t> BinaryPlistReader::readRefs(uint64_t count) {
  checkFits(count, mTrailer.object_ref_size, mIn.tell());
  std::vector<uint64_t> refs;
  refs.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    refs.push_back(mIn.readUInt(mTrailer.object_ref_size));
  }
  return refs;
}

Value BinaryPlistReader::loadSimple(uint8_t objarg, size_t offset) {
  switch (objarg) {
  case SIMPLE_NULL:
    return Value();
  case SIMPLE_FALSE:
    return Value(false);
  case SIMPLE_TRUE:
    return Value(true);
  case SIMPLE_FILL:
    warn("Binary format",
         "Fill byte at offset " + std::to_string(offset) + " read as null");
    return Value();
  default:
    throw MalformedPlistError("Unknown simple " + std::to_string(objarg) +
                              " at offset " + std::to_string(offset));
  }
}

// Read unsigned and cast to int64; narrow negatives are not sign-extended.
Value BinaryPlistReader::loadInt(uint8_t objarg, size_t offset) {
  if (objarg > 4) {
    throw MalformedPlistError("Integer at offset " + std::to_string(offset) +
                              " has invalid width exponent " +
                              std::to_string(objarg));
  }
  return Value(static_cast<int64_t>(mIn.readUInt(size_t{1} << objarg)));
}

Value BinaryPlistReader::loadReal(uint8_t objarg, size_t offset) {
  switch (objarg) {
  case 2:
    return Value(static_cast<double>(mIn.readFloat()));
  case 3:
    return Value(mIn.readDouble());
  default:
    throw MalformedPlistError("Real at offset " + std::to_string(offset) +
                              " has unsupported width " +
                              std::to_string(1u << objarg));
  }
}

Value BinaryPlistReader::loadDate(uint8_t, size_t offset) {
  double seconds = mIn.readDouble();
  // about +/- 28000 years around 2001, the range of the calendar types
  if (!std::isfinite(seconds) || std::fabs(seconds) > 9.0e11) {
    throw MalformedPlistError("Date at offset " + std::to_string(offset) +
                              " is out of range");
  }
  double whole = std::floor(seconds);
  if (whole != seconds) {
    warn("Date precision", "Fractional seconds dropped from date at offset " +
                               std::to_string(offset));
  }
  return Value(Date(std::chrono::seconds(EPOCH_2001 +
                                         static_cast<int64_t>(whole))));
}

Value BinaryPlistReader::loadData(uint8_t objarg) {
  uint64_t count = readCount(objarg);
  checkFits(count, 1, mIn.tell());
  std::string_view bytes = mIn.readBytes(static_cast<size_t>(count));
  return Value(Data(bytes.begin(), bytes.end()));
}

Value BinaryPlistReader::loadAscii(uint8_t objarg) {
  uint64_t count = readCount(objarg);
  checkFits(count, 1, mIn.tell());
  return Value(std::string(mIn.readBytes(static_cast<size_t>(count))));
}

// count is in UTF-16 code units, not bytes
Value BinaryPlistReader::loadUnicode(uint8_t objarg) {
  uint64_t count = readCount(objarg);
  checkFits(count, 2, mIn.tell());
  std::string_view bytes = mIn.readBytes(static_cast<size_t>(count * 2));
  return Value(utf16be_to_utf8(reinterpret_cast<const uint8_t *>(bytes.data()),
                               static_cast<size_t>(count)));
}

Value BinaryPlistReader::loadUid(uint8_t objarg, size_t offset) {
  if (objarg > 4) {
    throw MalformedPlistError("Uid at offset " + std::to_string(offset) +
                              " has invalid width exponent " +
                              std::to_string(objarg));
  }
  return Value(Uid{mIn.readUInt(size_t{1} << objarg)});
}

Value BinaryPlistReader::loadArray(uint8_t objarg, uint64_t &weight) {
  std::vector<uint64_t> refs = readRefs(readCount(objarg));
  weight = sizeof(Value);
  Array array;
  array.reserve(refs.size());
  for (uint64_t ref : refs) {
    array.push_back(takeObject(ref, weight));
  }
  return Value(std::move(array));
}

Value BinaryPlistReader::loadSet(uint8_t objarg, uint64_t &weight) {
  std::vector<uint64_t> refs = readRefs(readCount(objarg));
  weight = sizeof(Value);
  Set set;
  set.items.reserve(refs.size());
  for (uint64_t ref : refs) {
    set.items.push_back(takeObject(ref, weight));
  }
  return Value(std::move(set));
}

// all key refs come first, then all value refs; pairs are positional
Value BinaryPlistReader::loadDict(uint8_t objarg, size_t offset,
                                  uint64_t &weight) {
  uint64_t count = readCount(objarg);
  std::vector<uint64_t> key_refs = readRefs(count);
  std::vector<uint64_t> value_refs = readRefs(count);
  weight = sizeof(Value);

  Dict dict;
  for (size_t i = 0; i < key_refs.size(); ++i) {
    Value key = takeObject(key_refs[i], weight);
    if (!key.isString()) {
      throw MalformedPlistError("Dict at offset " + std::to_string(offset) +
                                " has a " + typeName(key.type()) + " key");
    }
    std::string key_str = key.asString();
    if (!dict.set(key_str, takeObject(value_refs[i], weight))) {
      warn("Duplicate key", "Key '" + key_str + "' repeated in dict at offset " +
                                std::to_string(offset));
    }
  }
  return Value(std::move(dict));
}

} // namespace plistkit
