// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Kvdns, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <kvdns/network/dns/dns_types.hpp>
#include <kvdns/network/dns/dns_wire.hpp>

namespace kvdns
{
namespace network
{
namespace dns
{

/// \brief Outcome of a lenient decode.
///
/// Decoding stops at the first failure; everything read up to that point is
/// kept in \c message, including a partially read question or record whose
/// unread fields stay zero.
struct DnsDecodeResult
{
  DnsMessage message;
  std::optional<DnsErrorCode> error;
  std::string errorDetail;

  bool ok() const { return !error.has_value(); }
};

/// \brief Encoder/decoder for uncompressed DNS messages (RFC 1035 4.1).
///
/// Names are written label by label without compression. On decode every
/// length byte is taken as a label length, so a compression pointer (0xC0
/// and up) in an incoming name is misread as a long label and usually ends
/// in TruncatedInput. Queries from ordinary stub resolvers never compress
/// the question name.
class DnsCodec
{
public:
  /// \brief Append the wire form of \p name to \p writer.
  ///
  /// "" and "." encode as the root. One trailing dot is ignored.
  /// \throws DnsCodecException EmptyLabel, LabelTooLong or NameTooLong;
  /// nothing is written in that case.
  static void encodeName(WireWriter &writer, const std::string &name)
  {
    std::vector<std::string> labels = splitLabels(name);

    std::size_t encodedSize = 1;
    for (const auto &label : labels)
    {
      encodedSize += label.size() + 1;
    }
    if (encodedSize > constants::DNS_MAX_NAME_SIZE)
    {
      throw DnsCodecException(DnsErrorCode::NameTooLong,
                              "encoded name is " + std::to_string(encodedSize) + " bytes: " + name);
    }

    for (const auto &label : labels)
    {
      writer.writeUint8(static_cast<std::uint8_t>(label.size()));
      writer.writeString(label);
    }
    writer.writeUint8(0);
  }

  static std::vector<std::uint8_t> encodeName(const std::string &name)
  {
    WireWriter writer;
    encodeName(writer, name);
    return writer.take();
  }

  /// \brief Read a name into \p name, joining labels with '.'.
  ///
  /// The root decodes as "". Labels read before a failure stay in \p name.
  /// \throws DnsCodecException TruncatedInput when the input ends before
  /// the zero-length root label.
  static void decodeName(WireReader &reader, std::string &name)
  {
    name.clear();
    while (true)
    {
      std::uint8_t length = reader.readUint8();
      if (length == 0)
      {
        return;
      }
      std::string label = reader.readString(length);
      if (!name.empty())
      {
        name += '.';
      }
      name += label;
    }
  }

  static std::string decodeName(WireReader &reader)
  {
    std::string name;
    decodeName(reader, name);
    return name;
  }

  /// \brief Serialize \p message.
  ///
  /// Section counts come from the section sizes and rdlength from
  /// rdata.size(); the corresponding header fields are ignored.
  /// \throws DnsCodecException for names that cannot be encoded.
  static std::vector<std::uint8_t> encode(const DnsMessage &message)
  {
    WireWriter writer;
    writer.writeUint16(message.header.id);
    writer.writeUint16(message.header.flags);
    writer.writeUint16(static_cast<std::uint16_t>(message.questions.size()));
    writer.writeUint16(static_cast<std::uint16_t>(message.answers.size()));
    writer.writeUint16(static_cast<std::uint16_t>(message.authority.size()));
    writer.writeUint16(static_cast<std::uint16_t>(message.additional.size()));

    for (const auto &question : message.questions)
    {
      encodeName(writer, question.qname);
      writer.writeUint16(static_cast<std::uint16_t>(question.qtype));
      writer.writeUint16(static_cast<std::uint16_t>(question.qclass));
    }

    for (const auto *section : {&message.answers, &message.authority, &message.additional})
    {
      for (const auto &record : *section)
      {
        encodeRecord(writer, record);
      }
    }
    return writer.take();
  }

  /// \brief Lenient decode; never throws for malformed input.
  static DnsDecodeResult decode(const std::uint8_t *data, std::size_t size)
  {
    DnsDecodeResult result;
    DnsMessage &message = result.message;

    if (size < constants::DNS_HEADER_SIZE)
    {
      result.error = DnsErrorCode::HeaderTruncated;
      result.errorDetail = "message is " + std::to_string(size) + " bytes, header needs " +
                           std::to_string(constants::DNS_HEADER_SIZE);
      return result;
    }

    WireReader reader(data, size);
    message.header.id = reader.readUint16();
    message.header.flags = reader.readUint16();
    message.header.qdcount = reader.readUint16();
    message.header.ancount = reader.readUint16();
    message.header.nscount = reader.readUint16();
    message.header.arcount = reader.readUint16();

    for (std::uint16_t i = 0; i < message.header.qdcount; ++i)
    {
      message.questions.emplace_back("", static_cast<DnsType>(0), static_cast<DnsClass>(0));
      DnsQuestion &question = message.questions.back();
      try
      {
        decodeName(reader, question.qname);
        question.qtype = static_cast<DnsType>(reader.readUint16());
        question.qclass = static_cast<DnsClass>(reader.readUint16());
      }
      catch (const DnsCodecException &e)
      {
        result.error = DnsErrorCode::QuestionTruncated;
        result.errorDetail = "question " + std::to_string(i) + ": " + e.what();
        return result;
      }
    }

    struct Section
    {
      std::uint16_t count;
      std::vector<DnsResourceRecord> *records;
      const char *name;
    };
    const Section sections[] = {{message.header.ancount, &message.answers, "answer"},
                                {message.header.nscount, &message.authority, "authority"},
                                {message.header.arcount, &message.additional, "additional"}};

    for (const auto &section : sections)
    {
      for (std::uint16_t i = 0; i < section.count; ++i)
      {
        section.records->emplace_back("", static_cast<DnsType>(0), static_cast<DnsClass>(0), 0);
        DnsResourceRecord &record = section.records->back();
        try
        {
          decodeRecord(reader, record);
        }
        catch (const DnsCodecException &e)
        {
          result.error = DnsErrorCode::RecordTruncated;
          result.errorDetail =
            std::string(section.name) + " record " + std::to_string(i) + ": " + e.what();
          return result;
        }
      }
    }
    return result;
  }

  static DnsDecodeResult decode(const std::vector<std::uint8_t> &data)
  {
    return decode(data.data(), data.size());
  }

  /// \brief Decode, throwing on the first failure.
  /// \throws DnsCodecException with the same code a lenient decode reports.
  static DnsMessage decodeStrict(const std::vector<std::uint8_t> &data)
  {
    DnsDecodeResult result = decode(data);
    if (!result.ok())
    {
      throw DnsCodecException(*result.error, result.errorDetail);
    }
    return std::move(result.message);
  }

  /// \brief True when an encoded message no longer fits a plain UDP datagram.
  static bool exceedsUdpLimit(const std::vector<std::uint8_t> &encoded)
  {
    return encoded.size() > constants::DNS_MAX_UDP_SIZE;
  }

private:
  static std::vector<std::string> splitLabels(const std::string &name)
  {
    std::vector<std::string> labels;
    if (name.empty() || name == ".")
    {
      return labels;
    }

    std::string trimmed = name;
    if (trimmed.back() == '.')
    {
      trimmed.pop_back();
    }

    std::size_t start = 0;
    while (true)
    {
      std::size_t dot = trimmed.find('.', start);
      std::string label =
        trimmed.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
      if (label.empty())
      {
        throw DnsCodecException(DnsErrorCode::EmptyLabel, "empty label in name: " + name);
      }
      if (label.size() > constants::DNS_MAX_LABEL_SIZE)
      {
        throw DnsCodecException(DnsErrorCode::LabelTooLong,
                                "label of " + std::to_string(label.size()) +
                                  " bytes in name: " + name);
      }
      labels.push_back(std::move(label));
      if (dot == std::string::npos)
      {
        break;
      }
      start = dot + 1;
    }
    return labels;
  }

  static void encodeRecord(WireWriter &writer, const DnsResourceRecord &record)
  {
    encodeName(writer, record.name);
    writer.writeUint16(static_cast<std::uint16_t>(record.type));
    writer.writeUint16(static_cast<std::uint16_t>(record.cls));
    writer.writeUint32(record.ttl);
    writer.writeUint16(static_cast<std::uint16_t>(record.rdata.size()));
    writer.writeBytes(record.rdata);
  }

  static void decodeRecord(WireReader &reader, DnsResourceRecord &record)
  {
    decodeName(reader, record.name);
    record.type = static_cast<DnsType>(reader.readUint16());
    record.cls = static_cast<DnsClass>(reader.readUint16());
    record.ttl = reader.readUint32();
    record.rdlength = reader.readUint16();
    record.rdata = reader.readBytes(record.rdlength);
  }
};

} // namespace dns
} // namespace network
} // namespace kvdns
