#pragma once

#include <array>
#include <cstddef>
#include <string>

#include "sql_int.h"
#include "sql_limit.h"

/*
 * Row
 *
 * The one fixed-schema record the table stores. Text columns are fixed-size
 * byte arrays: a value shorter than its column is padded with NULs, and a
 * value exactly as long as its column has no terminator at all.
 */
struct Row {
  u32 id;
  std::array<char, kColumnUsernameSize> username;
  std::array<char, kColumnEmailSize> email;

  Row();
};

/* ------------------------------------
 *  Serialized row (291 bytes)
 *
 *  | id u32 @0 | username[32] @4 | email[255] @36 |
 *  ------------------------------
 */
constexpr u32 kIdSize = sizeof(u32);
constexpr u32 kUsernameSize = kColumnUsernameSize;
constexpr u32 kEmailSize = kColumnEmailSize;
constexpr u32 kIdOffset = 0;
constexpr u32 kUsernameOffset = kIdOffset + kIdSize;
constexpr u32 kEmailOffset = kUsernameOffset + kUsernameSize;
constexpr u32 kRowSize = kIdSize + kUsernameSize + kEmailSize;

static_assert(kRowSize == 291, "row layout is part of the file format");

// Writes exactly kRowSize bytes starting at dest. The id is little-endian.
void SerializeRow(const Row &row, std::byte *dest);

// Reads exactly kRowSize bytes starting at src.
void DeserializeRow(const std::byte *src, Row &row);

// Builds a row from its column values. Returns false, leaving row untouched,
// if a string does not fit in its column.
[[nodiscard]] bool MakeRow(u32 id, const std::string &username,
                           const std::string &email, Row &row);

// Column values up to the first NUL (or the whole column if there is none)
std::string RowUsername(const Row &row);
std::string RowEmail(const Row &row);

// "(id, username, email)"
std::string ToString(const Row &row);

bool operator==(const Row &lhs, const Row &rhs);
bool operator!=(const Row &lhs, const Row &rhs);
