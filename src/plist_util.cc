#include "plist_util.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "plist_error.hpp"

namespace plistkit {

namespace {

constexpr std::string_view kBase64Chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

void append_utf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

} // anonymous namespace

std::string base64_encode(const uint8_t *data, size_t len) {
  std::string encoded;
  encoded.reserve(((len + 2) / 3) * 4);

  for (size_t i = 0; i < len; i += 3) {
    uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
    if (i + 1 < len)
      triple |= static_cast<uint32_t>(data[i + 1]) << 8;
    if (i + 2 < len)
      triple |= static_cast<uint32_t>(data[i + 2]);

    encoded += kBase64Chars[(triple >> 18) & 0x3F];
    encoded += kBase64Chars[(triple >> 12) & 0x3F];
    encoded += (i + 1 < len) ? kBase64Chars[(triple >> 6) & 0x3F] : '=';
    encoded += (i + 2 < len) ? kBase64Chars[triple & 0x3F] : '=';
  }
  return encoded;
}

Data base64_decode(std::string_view text) {
  Data result;
  result.reserve(text.size() * 3 / 4);
  uint32_t val = 0;
  int valb = -8;
  for (char c : text) {
    if (c == '=')
      break;
    if (std::isspace(static_cast<unsigned char>(c)))
      continue;
    auto pos = kBase64Chars.find(c);
    if (pos == std::string_view::npos) {
      throw MalformedPlistError("Invalid base64 character '" +
                                std::string(1, c) + "' in data");
    }
    val = (val << 6) + static_cast<uint32_t>(pos);
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

std::string encode_xml_entities(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  for (char c : text) {
    switch (c) {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    default:
      result += c;
      break;
    }
  }
  return result;
}

Date parse_date(std::string_view text) {
  std::tm tm = {};
  std::istringstream ss{std::string(text)};
  ss >> std::get_time(&tm, PLIST_DATE_FORMAT);
  if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
    throw MalformedPlistError("Invalid date '" + std::string(text) + "'");
  }

  using namespace std::chrono;
  year_month_day ymd{year{tm.tm_year + 1900}, month{static_cast<unsigned>(tm.tm_mon + 1)},
                     day{static_cast<unsigned>(tm.tm_mday)}};
  if (!ymd.ok() || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) {
    throw MalformedPlistError("Invalid date '" + std::string(text) + "'");
  }
  return sys_days{ymd} + hours{tm.tm_hour} + minutes{tm.tm_min} +
         seconds{tm.tm_sec};
}

std::string format_date(Date date) {
  using namespace std::chrono;
  sys_days day_point = floor<days>(date);
  year_month_day ymd{day_point};
  hh_mm_ss<seconds> tod{date - day_point};

  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year())
     << '-' << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
     << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
     << std::setw(2) << tod.hours().count() << ':' << std::setw(2)
     << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
     << 'Z';
  return ss.str();
}

std::string utf16be_to_utf8(const uint8_t *data, size_t units) {
  std::string out;
  out.reserve(units);

  for (size_t i = 0; i < units; ++i) {
    uint32_t unit = (static_cast<uint32_t>(data[2 * i]) << 8) | data[2 * i + 1];
    if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units) {
      uint32_t low =
          (static_cast<uint32_t>(data[2 * i + 2]) << 8) | data[2 * i + 3];
      if (low >= 0xDC00 && low <= 0xDFFF) {
        append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
        ++i;
        continue;
      }
    }
    if (unit >= 0xD800 && unit <= 0xDFFF) {
      append_utf8(out, 0xFFFD);
    } else {
      append_utf8(out, unit);
    }
  }
  return out;
}

} // namespace plistkit
