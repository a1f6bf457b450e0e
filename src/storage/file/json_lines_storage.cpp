/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/file/json_lines_storage.hpp"

#include <istream>
#include <ostream>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "log/formatters/filepath.hpp"
#include "serde/json.hpp"
#include "storage/storage_error.hpp"

namespace ringstore::storage {

  outcome::result<std::vector<StorageEntry>> JsonLinesStorage::parse(
      std::istream &in) const {
    std::vector<StorageEntry> entries;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      if (line.find_first_not_of(" \t\r") == std::string::npos) {
        continue;
      }

      auto malformed = [&] {
        SL_ERROR(logger_, "Malformed line {} in {}", line_no, path());
        return StorageError::INVALID_FORMAT;
      };

      auto doc_res = json::parse(line);
      if (doc_res.has_error()) {
        return malformed();
      }
      auto &doc = doc_res.value();
      if (not doc.IsArray() or doc.Empty() or doc.Size() > 2
          or not doc[0].IsArray()) {
        return malformed();
      }

      ByteVec key;
      for (auto &byte : doc[0].GetArray()) {
        if (not byte.IsUint() or byte.GetUint() > 0xff) {
          return malformed();
        }
        key.push_back(static_cast<uint8_t>(byte.GetUint()));
      }

      std::string value;
      if (doc.Size() == 2) {
        if (not doc[1].IsString()) {
          return malformed();
        }
        value.assign(doc[1].GetString(), doc[1].GetStringLength());
      }
      entries.emplace_back(std::move(key), std::move(value));
    }
    if (in.bad()) {
      return StorageError::IO_ERROR;
    }
    return entries;
  }

  outcome::result<void> JsonLinesStorage::serialize(
      std::ostream &out, const std::vector<StorageEntry> &entries) const {
    for (auto &[key, value] : entries) {
      rapidjson::StringBuffer buffer;
      rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
      writer.StartArray();
      writer.StartArray();
      for (auto byte : key) {
        writer.Uint(byte);
      }
      writer.EndArray();
      if (not value.empty()) {
        writer.String(value.data(),
                      static_cast<rapidjson::SizeType>(value.size()));
      }
      writer.EndArray();
      out.write(buffer.GetString(),
                static_cast<std::streamsize>(buffer.GetSize()));
      out.put('\n');
    }
    return outcome::success();
  }

}  // namespace ringstore::storage
