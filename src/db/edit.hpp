/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <rapidjson/document.h>

namespace ringstore::db {

  enum class EditError : uint8_t {
    INVALID_JSON = 1,
    NOT_AN_OBJECT,
    UNKNOWN_EDIT,
  };

  /**
   * @brief Pure transformation of an object's JSON data.
   *
   * An edit depends only on the data it is applied to, so the result is the
   * same regardless of the ring which stores the object.
   */
  class Edit {
   public:
    enum class Kind : uint8_t {
      OVERWRITE,    ///< replace the whole data
      MERGE_PATCH,  ///< RFC 7386 JSON merge patch
      SET,          ///< set one top-level field
      UNSET,        ///< remove one top-level field
    };

    static Edit overwrite(std::string data);
    static Edit mergePatch(std::string patch);
    static Edit set(std::string field, std::string value);
    static Edit unset(std::string field);

    /// Edit by kind name: `overwrite`, `merge` or `set`/`unset` with field
    static outcome::result<Edit> fromName(std::string_view name,
                                          std::string json,
                                          std::string field = {});

    Kind kind() const {
      return kind_;
    }

    outcome::result<void> apply(rapidjson::Document &data) const;

   private:
    Edit(Kind kind, std::string field, std::string json)
        : kind_{kind}, field_{std::move(field)}, json_{std::move(json)} {}

    Kind kind_;
    std::string field_;
    std::string json_;
  };

  /// Applies `edits` in order to JSON `data` and returns the new JSON text
  outcome::result<std::string> applyEdits(std::string_view data,
                                          const std::vector<Edit> &edits);

}  // namespace ringstore::db

OUTCOME_HPP_DECLARE_ERROR(ringstore::db, EditError);
