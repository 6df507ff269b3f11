// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace kvdns
{
namespace network
{
namespace dns
{

/// \brief Codec failure categories
enum class DnsErrorCode
{
  HeaderTruncated,    ///< Fewer than 12 bytes of header
  QuestionTruncated,  ///< Input ended inside a question entry
  RecordTruncated,    ///< Input ended inside an answer/authority/additional entry
  TruncatedInput,     ///< Reader exhausted (name without root label, short field)
  LabelTooLong,       ///< Label over 63 bytes on encode
  EmptyLabel,         ///< Empty label inside a name on encode
  NameTooLong         ///< Encoded name over 255 bytes
};

inline const char *toString(DnsErrorCode code)
{
  switch (code)
  {
  case DnsErrorCode::HeaderTruncated:
    return "HeaderTruncated";
  case DnsErrorCode::QuestionTruncated:
    return "QuestionTruncated";
  case DnsErrorCode::RecordTruncated:
    return "RecordTruncated";
  case DnsErrorCode::TruncatedInput:
    return "TruncatedInput";
  case DnsErrorCode::LabelTooLong:
    return "LabelTooLong";
  case DnsErrorCode::EmptyLabel:
    return "EmptyLabel";
  case DnsErrorCode::NameTooLong:
    return "NameTooLong";
  }
  return "Unknown";
}

/// \brief Thrown by the wire reader/writer and the codec
class DnsCodecException : public std::runtime_error
{
public:
  DnsCodecException(DnsErrorCode code, const std::string &message)
      : std::runtime_error(std::string("DNS ") + toString(code) + ": " + message), _code(code)
  {
  }

  DnsErrorCode code() const { return _code; }

private:
  DnsErrorCode _code;
};

/// \brief Sequential big-endian reader over a borrowed buffer.
///
/// Every read checks bounds and throws DnsErrorCode::TruncatedInput when the
/// buffer is exhausted; nothing is consumed by a failed read.
class WireReader
{
public:
  WireReader(const std::uint8_t *data, std::size_t size) : _data(data), _size(size) {}

  std::size_t offset() const { return _offset; }
  std::size_t remaining() const { return _size - _offset; }
  bool exhausted() const { return _offset >= _size; }

  std::uint8_t readUint8()
  {
    checkBounds(1);
    return _data[_offset++];
  }

  std::uint16_t readUint16()
  {
    checkBounds(2);
    std::uint16_t netValue;
    std::memcpy(&netValue, _data + _offset, 2);
    _offset += 2;
    return ntohs(netValue);
  }

  std::uint32_t readUint32()
  {
    checkBounds(4);
    std::uint32_t netValue;
    std::memcpy(&netValue, _data + _offset, 4);
    _offset += 4;
    return ntohl(netValue);
  }

  std::vector<std::uint8_t> readBytes(std::size_t count)
  {
    checkBounds(count);
    std::vector<std::uint8_t> bytes(_data + _offset, _data + _offset + count);
    _offset += count;
    return bytes;
  }

  std::string readString(std::size_t count)
  {
    checkBounds(count);
    std::string str(reinterpret_cast<const char *>(_data + _offset), count);
    _offset += count;
    return str;
  }

private:
  void checkBounds(std::size_t needed) const
  {
    if (needed > remaining())
    {
      throw DnsCodecException(DnsErrorCode::TruncatedInput,
                              "insufficient data at offset " + std::to_string(_offset) +
                                ", needed " + std::to_string(needed) + ", total " +
                                std::to_string(_size));
    }
  }

  const std::uint8_t *_data;
  std::size_t _size;
  std::size_t _offset = 0;
};

/// \brief Growable big-endian writer
class WireWriter
{
public:
  WireWriter() { _buffer.reserve(512); }

  void writeUint8(std::uint8_t value) { _buffer.push_back(value); }

  void writeUint16(std::uint16_t value)
  {
    std::uint16_t netValue = htons(value);
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
    _buffer.insert(_buffer.end(), bytes, bytes + 2);
  }

  void writeUint32(std::uint32_t value)
  {
    std::uint32_t netValue = htonl(value);
    const auto *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
    _buffer.insert(_buffer.end(), bytes, bytes + 4);
  }

  void writeBytes(const std::uint8_t *data, std::size_t size)
  {
    _buffer.insert(_buffer.end(), data, data + size);
  }

  void writeBytes(const std::vector<std::uint8_t> &data)
  {
    _buffer.insert(_buffer.end(), data.begin(), data.end());
  }

  void writeString(const std::string &str) { _buffer.insert(_buffer.end(), str.begin(), str.end()); }

  std::size_t size() const { return _buffer.size(); }
  const std::vector<std::uint8_t> &buffer() const { return _buffer; }
  std::vector<std::uint8_t> take() { return std::move(_buffer); }

private:
  std::vector<std::uint8_t> _buffer;
};

} // namespace dns
} // namespace network
} // namespace kvdns
